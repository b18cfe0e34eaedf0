/**
 * @file EncodingAdapter.cpp
 * @brief Per-connection byte/text conversion with a lossless fallback
 */

#include "transease/EncodingAdapter.h"
#include <QByteArray>
#include <QByteArrayView>
#include <QString>
#include <QStringDecoder>
#include <QStringEncoder>
#include <algorithm>
#include <cctype>

namespace TransEase {

namespace {

// Name understood by QStringConverter for a canonical encoding.
const char* backendName(const std::string& canonical) {
    if (canonical == "utf-8") {
        return "UTF-8";
    }
    if (canonical == "latin1") {
        return "ISO-8859-1";
    }
    return "GB18030";
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string latin1ToUtf8(const std::string& bytes) {
    return QString::fromLatin1(bytes.data(), static_cast<qsizetype>(bytes.size()))
        .toUtf8().toStdString();
}

} // anonymous namespace

EncodingAdapter::EncodingAdapter(const std::string& encoding)
    : m_encoding(canonicalEncodingName(encoding))
    , m_primaryAvailable(false)
{
    if (m_encoding.empty()) {
        m_encoding = "latin1";
    }
    m_primaryAvailable = isEncodingAvailable(m_encoding);
}

std::string EncodingAdapter::canonicalEncodingName(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "gb18030" || lower == "gbk" || lower == "gb2312") {
        return "gb18030";
    }
    if (lower == "utf-8" || lower == "utf8") {
        return "utf-8";
    }
    if (lower == "latin1" || lower == "latin-1" || lower == "iso-8859-1" || lower == "iso8859-1") {
        return "latin1";
    }
    return {};
}

bool EncodingAdapter::isEncodingAvailable(const std::string& encoding) {
    const std::string canonical = canonicalEncodingName(encoding);
    if (canonical.empty()) {
        return false;
    }
    QStringDecoder decoder(backendName(canonical));
    return decoder.isValid();
}

std::string EncodingAdapter::decode(const std::string& bytes) const {
    if (bytes.empty()) {
        return {};
    }

    if (m_primaryAvailable && m_encoding != "latin1") {
        QStringDecoder decoder(backendName(m_encoding), QStringConverter::Flag::Stateless);
        const QString text = decoder.decode(
            QByteArrayView(bytes.data(), static_cast<qsizetype>(bytes.size())));
        if (!decoder.hasError()) {
            return text.toUtf8().toStdString();
        }
    }

    return latin1ToUtf8(bytes);
}

std::string EncodingAdapter::encode(const std::string& text) const {
    if (text.empty()) {
        return {};
    }

    // Malformed UTF-8 input becomes U+FFFD here rather than an error.
    const QString unicode = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));

    if (m_primaryAvailable && m_encoding != "latin1") {
        QStringEncoder encoder(backendName(m_encoding), QStringConverter::Flag::Stateless);
        const QByteArray bytes = encoder.encode(unicode);
        if (!encoder.hasError()) {
            return bytes.toStdString();
        }
    }

    return unicode.toLatin1().toStdString();
}

}  // namespace TransEase
