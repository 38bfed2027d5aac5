/**
 * @file input.hpp
 * @brief Character sources for the scanner, plus BOM/encoding detection for raw byte buffers.
 *
 * An Input is one of three kinds:
 *   - a view over a caller-owned UTF-8 buffer (the only kind whose text may be borrowed),
 *   - an owned UTF-8 buffer (for example the result of decoding UTF-16),
 *   - a pull source (an iterator range or `std::istream`) read incrementally into a
 *     sliding lookahead window.
 */

#ifndef YAML_CHURN_INPUT_HPP
#define YAML_CHURN_INPUT_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "chars.hpp"
#include "error.hpp"
#include "log.hpp"

namespace Churn {

/** @brief What to do with byte sequences that are not valid in the detected encoding. */
enum class EncodingTrap {
    Strict,  ///< Throw a SourceError at the first malformed sequence.
    Replace, ///< Substitute U+FFFD.
    Ignore   ///< Drop the malformed bytes.
};

/** @brief Encoding detected for a byte buffer. */
enum class Encoding { Utf8, Utf16LE, Utf16BE };

/** @brief Options for LoadBytes / Parser::FromBytes. */
struct DecodeOptions {
    EncodingTrap trap = EncodingTrap::Strict;
};

/**
 * @brief Detect the encoding of `bytes` from its BOM, or from zero bytes when there is none.
 * @param bom_length Receives the number of BOM bytes to skip.
 */
inline Encoding DetectEncoding(std::string_view bytes, std::size_t& bom_length) noexcept {
    auto b = [&](std::size_t i) { return static_cast<unsigned char>(bytes[i]); };
    bom_length = 0;
    if (bytes.size() >= 3 && b(0) == 0xEF && b(1) == 0xBB && b(2) == 0xBF) {
        bom_length = 3;
        return Encoding::Utf8;
    }
    if (bytes.size() >= 2 && b(0) == 0xFF && b(1) == 0xFE) {
        bom_length = 2;
        return Encoding::Utf16LE;
    }
    if (bytes.size() >= 2 && b(0) == 0xFE && b(1) == 0xFF) {
        bom_length = 2;
        return Encoding::Utf16BE;
    }
    if (bytes.size() > 1 && b(0) != b(1)) {
        if (b(0) == 0) return Encoding::Utf16BE;
        if (b(1) == 0) return Encoding::Utf16LE;
    }
    return Encoding::Utf8;
}

/// @cond INTERNAL
namespace detail {

// Line of the next decoded character, for error positions.
inline std::size_t CountLines(const std::string& decoded) {
    std::size_t lines = 1;
    for (char c : decoded)
        if (c == '\n') ++lines;
    return lines;
}

inline void Malformed(std::string& out, EncodingTrap trap, std::size_t byte_index, std::string_view what) {
    switch (trap) {
        case EncodingTrap::Strict:
            throw Error(ErrorKind::Source, Marker(byte_index, CountLines(out), 0),
                        fmt::format("invalid {} sequence", what));
        case EncodingTrap::Replace:
            Log::Warning("replacing invalid {} sequence at byte {}", what, byte_index);
            Chars::AppendUtf8(out, 0xFFFD);
            break;
        case EncodingTrap::Ignore:
            Log::Warning("dropping invalid {} sequence at byte {}", what, byte_index);
            break;
    }
}

inline void DecodeUtf8(std::string_view in, std::size_t offset, EncodingTrap trap, std::string& out) {
    std::size_t i = 0;
    while (i < in.size()) {
        unsigned char c = static_cast<unsigned char>(in[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        bool ok = len != 0 && i + len <= in.size();
        for (std::size_t k = 1; ok && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(in[i + k]);
            if ((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        static constexpr std::uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
        if (ok && (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
            ok = false;
        if (!ok) {
            Malformed(out, trap, offset + i, "UTF-8");
            ++i;
            continue;
        }
        out.append(in.substr(i, len));
        i += len;
    }
}

inline void DecodeUtf16(std::string_view in, std::size_t offset, bool big_endian, EncodingTrap trap, std::string& out) {
    auto unit = [&](std::size_t i) -> std::uint32_t {
        auto lo = static_cast<unsigned char>(in[i + (big_endian ? 1 : 0)]);
        auto hi = static_cast<unsigned char>(in[i + (big_endian ? 0 : 1)]);
        return (static_cast<std::uint32_t>(hi) << 8) | lo;
    };
    std::size_t i = 0;
    while (i + 1 < in.size()) {
        std::uint32_t u = unit(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 3 < in.size()) {
                std::uint32_t u2 = unit(i + 2);
                if (u2 >= 0xDC00 && u2 <= 0xDFFF) {
                    Chars::AppendUtf8(out, 0x10000 + ((u - 0xD800) << 10) + (u2 - 0xDC00));
                    i += 4;
                    continue;
                }
            }
            Malformed(out, trap, offset + i, "UTF-16");
            i += 2;
            continue;
        }
        if (u >= 0xDC00 && u <= 0xDFFF) {
            Malformed(out, trap, offset + i, "UTF-16");
            i += 2;
            continue;
        }
        Chars::AppendUtf8(out, u);
        i += 2;
    }
    if (i < in.size())
        Malformed(out, trap, offset + i, "UTF-16");
}

} // namespace detail
/// @endcond

/**
 * @brief Decode a raw byte buffer (UTF-8 or UTF-16 with or without BOM) to UTF-8, dropping the BOM.
 * @throws Error (ErrorKind::Source) on malformed input under EncodingTrap::Strict.
 */
inline std::string DecodeBytes(std::string_view bytes, const DecodeOptions& options = {}) {
    std::size_t bom = 0;
    Encoding enc = DetectEncoding(bytes, bom);
    std::string out;
    out.reserve(enc == Encoding::Utf8 ? bytes.size() : bytes.size() / 2 + 1);
    std::string_view body = bytes.substr(bom);
    switch (enc) {
        case Encoding::Utf8:    detail::DecodeUtf8(body, bom, options.trap, out); break;
        case Encoding::Utf16LE: detail::DecodeUtf16(body, bom, false, options.trap, out); break;
        case Encoding::Utf16BE: detail::DecodeUtf16(body, bom, true, options.trap, out); break;
    }
    return out;
}

/**
 * @class Input
 * @brief Byte source with arbitrary lookahead, consumed by the Scanner.
 *
 * Positions are absolute byte offsets from the start of the (decoded) text. Reading
 * past the end yields `'\0'`.
 */
class Input {
public:
    /** @brief Pull callback: returns the next byte (0..255), or -1 at end of input. */
    using Pull = std::function<int()>;

    /**
     * @brief View a caller-owned UTF-8 buffer. The buffer must outlive the Input and
     *        any borrowed text handed out from it. A leading UTF-8 BOM is skipped.
     */
    static Input FromString(std::string_view text) {
        Input in;
        in.data_ = text;
        in.borrowable_ = true;
        in.SkipUtf8Bom();
        return in;
    }

    /** @brief Take ownership of a UTF-8 buffer. */
    static Input FromOwned(std::string text) {
        Input in;
        in.storage_ = std::make_unique<std::string>(std::move(text));
        in.data_ = *in.storage_;
        in.SkipUtf8Bom();
        return in;
    }

    /** @brief Read incrementally from a pull callback. A leading UTF-8 BOM is skipped. */
    static Input FromPull(Pull pull) {
        Input in;
        in.pull_ = std::move(pull);
        in.streaming_ = true;
        in.SkipStreamedBom();
        return in;
    }

    /**
     * @brief Read incrementally from an iterator range of characters.
     *
     * One-byte value types are taken as UTF-8 bytes; wider value types are taken as
     * code points and encoded.
     */
    template<typename It>
    static Input FromRange(It first, It last) {
        using Char = typename std::iterator_traits<It>::value_type;
        std::string pending;
        std::size_t pending_pos = 0;
        return FromPull([first, last, pending, pending_pos]() mutable -> int {
            if (pending_pos < pending.size())
                return static_cast<unsigned char>(pending[pending_pos++]);
            if (first == last)
                return -1;
            Char c = *first;
            ++first;
            if constexpr (sizeof(Char) == 1) {
                return static_cast<unsigned char>(c);
            } else {
                pending.clear();
                pending_pos = 0;
                if (!Chars::AppendUtf8(pending, static_cast<std::uint32_t>(c)))
                    Chars::AppendUtf8(pending, 0xFFFD);
                return static_cast<unsigned char>(pending[pending_pos++]);
            }
        });
    }

    /**
     * @brief Read incrementally from a stream. A stream that goes bad while reading
     *        raises a SourceError.
     */
    static Input FromStream(std::istream& is) {
        return FromPull([&is]() -> int {
            int c = is.get();
            if (c == std::char_traits<char>::eof()) {
                if (is.bad())
                    return kReadFailure;
                return -1;
            }
            return c;
        });
    }

    /** @brief The byte `n` positions ahead of the cursor, or `'\0'` past the end. */
    char Peek(std::size_t n = 0) {
        if (streaming_) {
            Fill(n + 1);
            std::size_t idx = pos_ - base_ + n;
            return idx < window_.size() ? window_[idx] : '\0';
        }
        std::size_t idx = pos_ + n;
        return idx < data_.size() ? data_[idx] : '\0';
    }

    /** @brief Whether the cursor is at the end of input. */
    bool AtEnd() {
        if (streaming_) {
            Fill(1);
            return pos_ - base_ >= window_.size();
        }
        return pos_ >= data_.size();
    }

    /** @brief Advance the cursor by `n` bytes. */
    void Skip(std::size_t n = 1) {
        pos_ += n;
        if (streaming_ && pos_ - base_ > kCompactThreshold) {
            std::size_t drop = std::min(pos_ - base_, window_.size());
            window_.erase(0, drop);
            base_ += drop;
        }
    }

    /** @brief Absolute byte offset of the cursor. */
    std::size_t Position() const noexcept { return pos_; }

    /** @brief Whether Slice() may be used to hand out text that outlives the Input. */
    bool CanBorrow() const noexcept { return borrowable_; }

    /** @brief The raw bytes in [begin, end). Only valid for non-streaming inputs. */
    std::string_view Slice(std::size_t begin, std::size_t end) const {
        return data_.substr(begin, end - begin);
    }

private:
    static constexpr int kReadFailure = -2;
    static constexpr std::size_t kCompactThreshold = 4096;

    Input() = default;

    void SkipUtf8Bom() {
        if (data_.size() >= 3 && static_cast<unsigned char>(data_[0]) == 0xEF &&
            static_cast<unsigned char>(data_[1]) == 0xBB && static_cast<unsigned char>(data_[2]) == 0xBF)
            pos_ = 3;
    }

    // The BOM bytes stay in the window so positions match FromString.
    void SkipStreamedBom() {
        Fill(3);
        if (window_.size() >= 3 && static_cast<unsigned char>(window_[0]) == 0xEF &&
            static_cast<unsigned char>(window_[1]) == 0xBB && static_cast<unsigned char>(window_[2]) == 0xBF) {
            pos_ = 3;
            fill_col_ = 0;
        }
    }

    void Fill(std::size_t need) {
        while (!eof_ && window_.size() - (pos_ - base_) < need) {
            int c = pull_();
            if (c == kReadFailure)
                throw Error(ErrorKind::Source, Marker(base_ + window_.size(), fill_line_, fill_col_),
                            "failed to read from the input stream");
            if (c < 0) {
                eof_ = true;
                break;
            }
            char ch = static_cast<char>(c);
            window_.push_back(ch);
            if (ch == '\n') {
                ++fill_line_;
                fill_col_ = 0;
            } else if (!Chars::IsContinuationByte(ch)) {
                ++fill_col_;
            }
        }
    }

    std::string_view data_;
    std::unique_ptr<std::string> storage_;
    bool borrowable_ = false;

    Pull pull_;
    bool streaming_ = false;
    bool eof_ = false;
    std::string window_;
    std::size_t base_ = 0;
    std::size_t fill_line_ = 1;
    std::size_t fill_col_ = 0;

    std::size_t pos_ = 0;
};

} // namespace Churn

#endif // YAML_CHURN_INPUT_HPP
