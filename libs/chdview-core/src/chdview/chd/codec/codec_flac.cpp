#include <chdview/chd/codec/codec_flac.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/util/data_ops.hpp>
#include <chdview/util/scope_guard.hpp>

#include <algorithm>
#include <cstring>

namespace chdview::chd::codec {

// fLaC marker and a single STREAMINFO block for 44100 Hz, 2 channels, 16 bits per sample. Block sizes at offsets 8 and
// 10 are filled in per hunk.
static constexpr std::array<uint8, 42> kStreamHeaderTemplate = {
    'f',  'L',  'a',  'C',                          // stream marker
    0x80, 0x00, 0x00, 0x22,                         // last metadata block, STREAMINFO, 34 bytes
    0x00, 0x00, 0x00, 0x00,                         // minimum and maximum block size
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,             // minimum and maximum frame size (unknown)
    0x0A, 0xC4, 0x42, 0xF0, 0x00, 0x00, 0x00, 0x00, // sample rate, channels, bits per sample, total samples
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // MD5 signature (none)
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};

static constexpr uint32 kChannels = 2;
static constexpr uint32 kBitsPerSample = 16;

uint32 FlacBlockSize(uint32 pcmBytes, uint32 limit) {
    uint32 blockSize = pcmBytes / 4;
    while (blockSize > limit) {
        blockSize /= 2;
    }
    return blockSize;
}

FlacFrameDecoder::FlacFrameDecoder()
    : m_decoder(FLAC__stream_decoder_new()) {}

Error FlacFrameDecoder::DecodeInterleaved(std::span<const uint8> frames, uint32 blockSize, std::span<uint8> output,
                                          std::endian endianness, size_t &bytesConsumed) {
    if (!m_decoder) {
        devlog::debug<grp::flac>("Failed to allocate the FLAC decoder");
        return Error::DecompressionError;
    }
    if (output.size() % (kChannels * sizeof(sint16)) != 0 || blockSize == 0 || blockSize > 0xFFFF) {
        return Error::DecompressionError;
    }

    m_streamHeader = kStreamHeaderTemplate;
    util::WriteBE<uint16>(&m_streamHeader[8], static_cast<uint16>(blockSize));
    util::WriteBE<uint16>(&m_streamHeader[10], static_cast<uint16>(blockSize));
    m_frames = frames;
    m_inputOffset = 0;
    m_output = output;
    m_outputOffset = 0;
    m_endianness = endianness;
    m_failed = false;

    FLAC__StreamDecoder *decoder = m_decoder.get();
    if (FLAC__stream_decoder_init_stream(decoder, ReadCallback, nullptr, TellCallback, nullptr, nullptr,
                                         WriteCallback, nullptr, ErrorCallback,
                                         this) != FLAC__STREAM_DECODER_INIT_STATUS_OK) {
        devlog::debug<grp::flac>("Failed to initialize the FLAC decoder");
        return Error::DecompressionError;
    }
    // MD5 checking is off, so finishing has nothing to report
    util::ScopeGuard sgFinish{[&] { FLAC__stream_decoder_finish(decoder); }};

    if (!FLAC__stream_decoder_process_until_end_of_metadata(decoder) || m_failed) {
        devlog::debug<grp::flac>("Failed to process the stream header");
        return Error::DecompressionError;
    }

    while (m_outputOffset < m_output.size()) {
        const bool processed = FLAC__stream_decoder_process_single(decoder);
        if (m_failed) {
            return Error::DecompressionError;
        }
        const FLAC__StreamDecoderState state = FLAC__stream_decoder_get_state(decoder);
        if (state == FLAC__STREAM_DECODER_END_OF_STREAM && m_outputOffset < m_output.size()) {
            devlog::debug<grp::flac>("Ran out of frames after {} of {} bytes", m_outputOffset, m_output.size());
            return Error::TruncatedStream;
        }
        if (!processed) {
            devlog::debug<grp::flac>("Failed to decode frame: {}", FLAC__StreamDecoderStateString[state]);
            return Error::DecompressionError;
        }
    }

    FLAC__uint64 position = 0;
    if (!FLAC__stream_decoder_get_decode_position(decoder, &position) || position < m_streamHeader.size()) {
        devlog::debug<grp::flac>("Failed to determine the decode position");
        return Error::DecompressionError;
    }
    bytesConsumed = static_cast<size_t>(position - m_streamHeader.size());
    return Error::None;
}

FLAC__StreamDecoderReadStatus FlacFrameDecoder::ReadCallback(const FLAC__StreamDecoder *, FLAC__byte buffer[],
                                                             size_t *bytes, void *clientData) {
    auto &self = *static_cast<FlacFrameDecoder *>(clientData);
    const size_t headerSize = self.m_streamHeader.size();
    const size_t totalSize = headerSize + self.m_frames.size();

    size_t written = 0;
    while (written < *bytes && self.m_inputOffset < totalSize) {
        size_t count;
        if (self.m_inputOffset < headerSize) {
            count = std::min(*bytes - written, headerSize - self.m_inputOffset);
            std::memcpy(&buffer[written], &self.m_streamHeader[self.m_inputOffset], count);
        } else {
            const size_t frameOffset = self.m_inputOffset - headerSize;
            count = std::min(*bytes - written, self.m_frames.size() - frameOffset);
            std::memcpy(&buffer[written], &self.m_frames[frameOffset], count);
        }
        written += count;
        self.m_inputOffset += count;
    }

    *bytes = written;
    return written == 0 ? FLAC__STREAM_DECODER_READ_STATUS_END_OF_STREAM : FLAC__STREAM_DECODER_READ_STATUS_CONTINUE;
}

FLAC__StreamDecoderTellStatus FlacFrameDecoder::TellCallback(const FLAC__StreamDecoder *,
                                                             FLAC__uint64 *absoluteByteOffset, void *clientData) {
    auto &self = *static_cast<FlacFrameDecoder *>(clientData);
    *absoluteByteOffset = self.m_inputOffset;
    return FLAC__STREAM_DECODER_TELL_STATUS_OK;
}

FLAC__StreamDecoderWriteStatus FlacFrameDecoder::WriteCallback(const FLAC__StreamDecoder *, const FLAC__Frame *frame,
                                                               const FLAC__int32 *const buffer[], void *clientData) {
    return static_cast<FlacFrameDecoder *>(clientData)->WriteFrame(frame, buffer);
}

void FlacFrameDecoder::ErrorCallback(const FLAC__StreamDecoder *, FLAC__StreamDecoderErrorStatus status,
                                     void *clientData) {
    devlog::debug<grp::flac>("Decoder error: {}", FLAC__StreamDecoderErrorStatusString[status]);
    static_cast<FlacFrameDecoder *>(clientData)->m_failed = true;
}

FLAC__StreamDecoderWriteStatus FlacFrameDecoder::WriteFrame(const FLAC__Frame *frame,
                                                            const FLAC__int32 *const buffer[]) {
    if (frame->header.channels != kChannels || frame->header.bits_per_sample != kBitsPerSample) {
        devlog::debug<grp::flac>("Unexpected frame format: {} channels, {} bits per sample", frame->header.channels,
                                 frame->header.bits_per_sample);
        m_failed = true;
        return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
    }

    // Samples past the end of the output are discarded
    static constexpr size_t kSampleFrameBytes = kChannels * sizeof(sint16);
    const size_t available = (m_output.size() - m_outputOffset) / kSampleFrameBytes;
    const size_t count = std::min<size_t>(frame->header.blocksize, available);
    for (size_t i = 0; i < count; i++) {
        for (uint32 ch = 0; ch < kChannels; ch++) {
            uint8 *out = &m_output[m_outputOffset + ch * sizeof(sint16)];
            const uint16 sample = static_cast<uint16>(buffer[ch][i]);
            if (m_endianness == std::endian::big) {
                util::WriteBE<uint16>(out, sample);
            } else {
                util::WriteLE<uint16>(out, sample);
            }
        }
        m_outputOffset += kSampleFrameBytes;
    }
    return FLAC__STREAM_DECODER_WRITE_STATUS_CONTINUE;
}

// -----------------------------------------------------------------------------
// flac

Error FlacCodec::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    if (src.empty()) {
        return Error::DecompressionError;
    }

    std::endian endianness;
    switch (src[0]) {
    case 'L': endianness = std::endian::little; break;
    case 'B': endianness = std::endian::big; break;
    default: devlog::debug<grp::codec>("Invalid FLAC byte order marker {:02X}", src[0]); return Error::DecompressionError;
    }

    const uint32 blockSize = FlacBlockSize(static_cast<uint32>(dst.size()), kFlacMaxBlockSize);
    size_t consumed;
    return m_decoder.DecodeInterleaved(src.subspan(1), blockSize, dst, endianness, consumed);
}

} // namespace chdview::chd::codec
