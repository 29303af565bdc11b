#pragma once

/**
@file
@brief FLAC codecs built on libFLAC.

CHD stores FLAC audio as a bare sequence of frames without the `fLaC` marker or a STREAMINFO block. The decoder feeds
libFLAC a synthesized stream header followed by the hunk's frames.
*/

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <FLAC/stream_decoder.h>

#include <array>
#include <bit>
#include <memory>
#include <span>

namespace chdview::chd::codec {

/// @brief Block sizes of `flac` hunks never exceed this many samples.
inline constexpr uint32 kFlacMaxBlockSize = 2048;

/// @brief Computes the FLAC block size used for a hunk: a quarter of the PCM bytes, halved until it fits `limit`.
/// @param[in] pcmBytes the number of PCM bytes (16-bit stereo) in the hunk
/// @param[in] limit the largest block size allowed
uint32 FlacBlockSize(uint32 pcmBytes, uint32 limit);

/// @brief Decodes bare 16-bit stereo FLAC frames into interleaved PCM.
class FlacFrameDecoder {
public:
    FlacFrameDecoder();

    /// @brief Decodes frames until `output` is full.
    ///
    /// Samples from the last frame that do not fit in `output` are discarded.
    ///
    /// @param[in] frames the frame sequence
    /// @param[in] blockSize the block size declared in the synthesized STREAMINFO
    /// @param[out] output receives interleaved samples; its size must be a multiple of 4
    /// @param[in] endianness byte order of the output samples
    /// @param[out] bytesConsumed receives the offset of the first byte past the last decoded frame
    Error DecodeInterleaved(std::span<const uint8> frames, uint32 blockSize, std::span<uint8> output,
                            std::endian endianness, size_t &bytesConsumed);

private:
    struct DecoderDeleter {
        void operator()(FLAC__StreamDecoder *decoder) const {
            FLAC__stream_decoder_delete(decoder);
        }
    };

    std::unique_ptr<FLAC__StreamDecoder, DecoderDeleter> m_decoder;

    // Per-call state read by the libFLAC callbacks
    std::array<uint8, 42> m_streamHeader{};
    std::span<const uint8> m_frames;
    size_t m_inputOffset = 0;
    std::span<uint8> m_output;
    size_t m_outputOffset = 0;
    std::endian m_endianness = std::endian::little;
    bool m_failed = false;

    static FLAC__StreamDecoderReadStatus ReadCallback(const FLAC__StreamDecoder *decoder, FLAC__byte buffer[],
                                                      size_t *bytes, void *clientData);
    static FLAC__StreamDecoderTellStatus TellCallback(const FLAC__StreamDecoder *decoder,
                                                      FLAC__uint64 *absoluteByteOffset, void *clientData);
    static FLAC__StreamDecoderWriteStatus WriteCallback(const FLAC__StreamDecoder *decoder, const FLAC__Frame *frame,
                                                        const FLAC__int32 *const buffer[], void *clientData);
    static void ErrorCallback(const FLAC__StreamDecoder *decoder, FLAC__StreamDecoderErrorStatus status,
                              void *clientData);

    FLAC__StreamDecoderWriteStatus WriteFrame(const FLAC__Frame *frame, const FLAC__int32 *const buffer[]);
};

/// @brief `flac` codec: a byte selecting the output byte order ('L' or 'B') followed by FLAC frames of 16-bit stereo
/// audio.
class FlacCodec {
public:
    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);

private:
    FlacFrameDecoder m_decoder;
};

} // namespace chdview::chd::codec
