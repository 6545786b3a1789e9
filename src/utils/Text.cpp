#include "Text.hpp"

#include <QByteArrayView>
#include <QString>
#include <QStringDecoder>

namespace configdesk::text {

std::optional<std::string> decodeUtf8(std::string_view bytes) {
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    QString decoded = decoder(QByteArrayView(bytes.data(), static_cast<qsizetype>(bytes.size())));
    if (decoder.hasError()) {
        return std::nullopt;
    }
    return decoded.toStdString();
}

std::string truncateChars(const std::string& text, std::size_t maxChars) {
    std::u32string codePoints = QString::fromStdString(text).toStdU32String();
    if (codePoints.size() <= maxChars) {
        return text;
    }
    codePoints.resize(maxChars);
    return QString::fromStdU32String(codePoints).toStdString();
}

std::string_view stripLineEnding(std::string_view line) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
    }
    return line;
}

} // namespace configdesk::text
