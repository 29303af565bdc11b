#include <chdview/chdview.hpp>

#include <chdview/chd/chd_defs.hpp>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace chdview;

static std::shared_ptr<chd::Image> OpenImage(const std::string &path) {
    std::error_code err{};
    auto reader = std::make_shared<media::FileBinaryReader>(path, err);
    if (err) {
        fmt::println("Could not open {}: {}", path, err.message());
        return nullptr;
    }

    auto image = std::make_shared<chd::Image>();
    if (chd::Error error = image->Open(reader); error != chd::Error::None) {
        fmt::println("Could not open {}: {}", path, chd::ToString(error));
        return nullptr;
    }
    return image;
}

static void PrintSummary(const chd::Image &image) {
    const chd::Header &header = image.GetHeader();

    fmt::println("File size: {}", image.ContainerSize());
    fmt::println("CHD version: {}", header.version);
    fmt::println("Logical size: {}", header.logicalBytes);
    fmt::println("Hunk size: {}", header.hunkBytes);
    fmt::println("Total hunks: {}", header.hunkCount);
    fmt::println("Unit size: {}", header.unitBytes);

    std::string compression{};
    for (uint32 tag : header.compressors) {
        if (tag == chd::kCodecNone) {
            break;
        }
        compression += fmt::format(" {}", chd::TagToString(tag));
    }
    fmt::println("Compression:{}", compression.empty() ? " none" : compression);

    if (header.logicalBytes > 0) {
        const double ratio = 100.0 * static_cast<double>(image.ContainerSize()) / header.logicalBytes;
        fmt::println("Ratio: {:.1f}%", ratio);
    }
    fmt::println("SHA1: {}", ToString(header.sha1));
    fmt::println("Data SHA1: {}", ToString(header.rawSHA1));
    if (header.HasParent()) {
        fmt::println("Parent SHA1: {}", ToString(header.parentSHA1));
    }
}

static bool DumpMetadata(const chd::Image &image) {
    std::vector<chd::MetadataEntry> entries;
    if (chd::Error error = image.EnumerateMetadata(entries); error != chd::Error::None) {
        fmt::println("Failed to read metadata: {}", chd::ToString(error));
        return false;
    }

    fmt::println("Metadata entries: {}", entries.size());
    std::vector<uint32> tagIndices{};
    std::vector<uint32> seenTags{};
    for (const chd::MetadataEntry &entry : entries) {
        // Count occurrences of each tag to address the entry by tag and index
        uint32 index = 0;
        if (auto it = std::find(seenTags.begin(), seenTags.end(), entry.tag); it != seenTags.end()) {
            index = ++tagIndices[std::distance(seenTags.begin(), it)];
        } else {
            seenTags.push_back(entry.tag);
            tagIndices.push_back(0);
        }

        std::vector<uint8> data;
        if (chd::Error error = image.ReadMetadata(entry.tag, index, data); error != chd::Error::None) {
            fmt::println("  {} #{}: {}", chd::TagToString(entry.tag), index, chd::ToString(error));
            return false;
        }

        // Most metadata is NUL-terminated text
        const bool printable = std::all_of(data.begin(), data.end(), [](uint8 ch) {
            return ch == 0 || std::isprint(ch) || std::isspace(ch);
        });
        if (printable) {
            std::string_view text{reinterpret_cast<const char *>(data.data()), data.size()};
            text = text.substr(0, text.find('\0'));
            fmt::println("  {} #{} (flags {:02X}, {} bytes): {}", chd::TagToString(entry.tag), index, entry.flags,
                         entry.length, text);
        } else {
            fmt::println("  {} #{} (flags {:02X}, {} bytes): <binary>", chd::TagToString(entry.tag), index,
                         entry.flags, entry.length);
        }
    }
    return true;
}

static bool Extract(const std::shared_ptr<chd::Image> &image, const std::string &outputPath) {
    std::ofstream out{outputPath, std::ios::binary | std::ios::trunc};
    if (!out) {
        fmt::println("Could not create {}", outputPath);
        return false;
    }

    chd::Stream stream{image};
    std::vector<uint8> buf(std::max<uint32>(image->HunkBytes(), 1) * 16);
    while (true) {
        uint64 bytesRead = 0;
        if (chd::Error error = stream.Read(buf, bytesRead); error != chd::Error::None) {
            fmt::println("Read failed at offset {}: {}", stream.Position(), chd::ToString(error));
            return false;
        }
        if (bytesRead == 0) {
            break;
        }
        out.write(reinterpret_cast<const char *>(buf.data()), bytesRead);
        if (!out) {
            fmt::println("Could not write to {}", outputPath);
            return false;
        }
    }
    fmt::println("Extracted {} bytes to {}", stream.Position(), outputPath);
    return true;
}

int main(int argc, char *argv[]) {
    bool showHelp = false;
    bool showVersion = false;
    bool dumpMetadata = false;
    bool verify = false;
    bool hash = false;
    uint32 cacheHunks = 16;
    std::string inputFile{};
    std::string parentFile{};
    std::string extractFile{};

    cxxopts::Options options("chdview-info",
                             fmt::format("CHD v5 image inspection tool\nVersion {}", version::fullstring));
    options.add_options()("h,help", "Display this help text.", cxxopts::value(showHelp)->default_value("false"));
    options.add_options()("v,version", "Display the version and exit.",
                          cxxopts::value(showVersion)->default_value("false"));
    options.add_options()("p,parent", "Attach the specified parent image.", cxxopts::value(parentFile), "path");
    options.add_options()("m,metadata", "Dump metadata entries.", cxxopts::value(dumpMetadata)->default_value("false"));
    options.add_options()("V,verify", "Verify the checksums of every hunk.",
                          cxxopts::value(verify)->default_value("false"));
    options.add_options()("H,hash", "Compute the XXH128 hash of the decoded data.",
                          cxxopts::value(hash)->default_value("false"));
    options.add_options()("x,extract", "Write the decoded data to the specified file.", cxxopts::value(extractFile),
                          "path");
    options.add_options()("c,cache", "Number of decompressed hunks to keep in memory.",
                          cxxopts::value(cacheHunks)->default_value("16"), "hunks");
    options.add_options()("input", "CHD image to inspect", cxxopts::value(inputFile));

    options.parse_positional({"input"});
    options.positional_help("<input>");

    try {
        auto result = options.parse(argc, argv);

        // Show help if requested
        if (showHelp) {
            fmt::println("{}", options.help());
            return 0;
        }
        if (showVersion) {
            fmt::println("chdview-info {}", version::fullstring);
            return 0;
        }

        // Input is required
        if (!result.contains("input")) {
            fmt::println("Missing argument: <input>");
            fmt::println("");
            fmt::println("{}", options.help());
            return 1;
        }

        fmt::println("Input file: {}", inputFile);
        auto image = OpenImage(inputFile);
        if (!image) {
            return 1;
        }
        image->configuration.cache.maxHunks = cacheHunks;

        std::shared_ptr<chd::Image> parent{};
        if (!parentFile.empty()) {
            parent = OpenImage(parentFile);
            if (!parent) {
                return 1;
            }
            if (chd::Error error = image->AttachParent(parent); error != chd::Error::None) {
                fmt::println("Could not attach parent {}: {}", parentFile, chd::ToString(error));
                return 1;
            }
        } else if (image->GetHeader().HasParent()) {
            fmt::println("Note: image depends on a parent; parent hunks cannot be read without --parent");
        }

        PrintSummary(*image);

        if (dumpMetadata && !DumpMetadata(*image)) {
            return 1;
        }

        if (verify) {
            uint32 failedHunk = 0;
            if (chd::Error error = image->Validate(&failedHunk); error != chd::Error::None) {
                fmt::println("Verification failed at hunk {}: {}", failedHunk, chd::ToString(error));
                return 1;
            }
            fmt::println("Verified {} hunks", image->HunkCount());
        }

        if (hash) {
            XXH128Hash contentHash{};
            if (chd::Error error = image->CalcContentHash(contentHash); error != chd::Error::None) {
                fmt::println("Hashing failed: {}", chd::ToString(error));
                return 1;
            }
            fmt::println("XXH128: {}", ToString(contentHash));
        }

        if (!extractFile.empty() && !Extract(image, extractFile)) {
            return 1;
        }
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::println("Failed to parse arguments: {}", e.what());
        return -1;
    } catch (const std::system_error &e) {
        fmt::println("System error: {}", e.what());
        return e.code().value();
    } catch (const std::exception &e) {
        fmt::println("Unhandled exception: {}", e.what());
        return -1;
    }

    return 0;
}
