/**
 * @file EncodingAdapter.h
 * @brief Per-connection byte/text conversion with a lossless fallback
 */

#pragma once

#include <string>

namespace TransEase {

/**
 * @brief Narrow codec interface the transfer engine calls for control-channel text
 *
 * Text is always UTF-8 inside the process; bytes are whatever travels on
 * the wire. Implementations must never throw.
 */
class TextCodec {
public:
    virtual ~TextCodec() = default;

    /// Wire bytes to UTF-8 text.
    virtual std::string decode(const std::string& bytes) const = 0;

    /// UTF-8 text to wire bytes.
    virtual std::string encode(const std::string& text) const = 0;

    /// Canonical name of the primary encoding.
    virtual const std::string& encoding() const = 0;
};

/**
 * @class EncodingAdapter
 * @brief TextCodec for one configured encoding with Latin-1 fallback
 *
 * decode() first tries the configured encoding strictly; if the bytes are
 * not valid in it (or the encoding is unavailable) every byte is mapped to
 * the code point of the same value (Latin-1), so any byte sequence yields
 * some text. encode() falls back the same way, replacing characters that
 * Latin-1 cannot represent with '?'.
 *
 * An adapter is created once per server start and never changes: a new
 * encoding only takes effect after a stop/start cycle.
 *
 * Thread Safety: const and stateless per call; safe to share between
 * connection threads.
 */
class EncodingAdapter : public TextCodec {
public:
    /**
     * @param encoding Encoding name (see canonicalEncodingName())
     */
    explicit EncodingAdapter(const std::string& encoding);

    std::string decode(const std::string& bytes) const override;
    std::string encode(const std::string& text) const override;
    const std::string& encoding() const override { return m_encoding; }

    /// True when the configured encoding could be loaded from the codec backend.
    bool isPrimaryAvailable() const { return m_primaryAvailable; }

    /// True when the handler should advertise UTF-8 filenames to clients.
    bool advertisesUtf8() const { return m_encoding == "utf-8"; }

    /**
     * @brief Map a user-supplied name to a supported canonical name
     * @return "gb18030", "utf-8" or "latin1"; empty if the name is not supported
     *
     * Case-insensitive. Accepts the aliases utf8, gbk, iso-8859-1 and latin-1.
     */
    static std::string canonicalEncodingName(const std::string& name);

    /**
     * @brief True if the codec backend on this system can convert the encoding
     */
    static bool isEncodingAvailable(const std::string& encoding);

private:
    std::string m_encoding;
    bool m_primaryAvailable;
};

}  // namespace TransEase
