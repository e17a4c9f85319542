/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for reading chunks from a PNG stream
     *
     * Controls strictness, size limits, and warning handling. Decoding a
     * single chunk from a buffer is not affected by these options; they
     * govern how a stream of chunks reacts to a malformed member.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, the first malformed chunk aborts parsing with an exception.
         * When false, chunks with a bad CRC, an unusable type code or an
         * oversized length are skipped, and a truncated tail ends iteration.
         * Every skip is reported through on_warning.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Chunks declaring a longer data field trigger an error or warning.
         * Default is the format maximum, 2^31 - 1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Stream offset of the chunk the warning is about
         * @param category Warning category (e.g., "size_limit", "crc_mismatch")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
