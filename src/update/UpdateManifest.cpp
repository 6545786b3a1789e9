#include "UpdateManifest.hpp"
#include "UpdateErrors.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

namespace configdesk {

namespace {

std::optional<std::string> optionalString(const QJsonObject& object, const char* key) {
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw UpdateCheckError(std::string("Invalid update manifest: '") + key + "' is not a string");
    }
    return value.toString().toStdString();
}

} // namespace

UpdateManifest UpdateManifest::parse(const std::string& json) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(
        QByteArray(json.data(), static_cast<qsizetype>(json.size())), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw UpdateCheckError("Invalid update manifest: " + parseError.errorString().toStdString());
    }
    if (!document.isObject()) {
        throw UpdateCheckError("Invalid update manifest: expected a JSON object");
    }
    const QJsonObject root = document.object();

    UpdateManifest manifest;

    const auto versionText = optionalString(root, "version");
    if (!versionText) {
        throw UpdateCheckError("Invalid update manifest: missing 'version'");
    }
    const auto version = Version::parse(*versionText);
    if (!version) {
        throw UpdateCheckError("Invalid update manifest: bad version '" + *versionText + "'");
    }
    manifest.version = *version;
    manifest.notes = optionalString(root, "notes");
    manifest.pubDate = optionalString(root, "pub_date");

    const QJsonValue platforms = root.value(QLatin1String("platforms"));
    if (!platforms.isObject()) {
        throw UpdateCheckError("Invalid update manifest: missing 'platforms'");
    }
    const QJsonObject platformObject = platforms.toObject();
    for (auto it = platformObject.begin(); it != platformObject.end(); ++it) {
        const std::string key = it.key().toStdString();
        if (!it.value().isObject()) {
            throw UpdateCheckError("Invalid update manifest: platform '" + key + "' is not an object");
        }
        const QJsonObject entry = it.value().toObject();
        PlatformArtifact artifact;
        auto url = optionalString(entry, "url");
        if (!url || url->empty()) {
            throw UpdateCheckError("Invalid update manifest: platform '" + key + "' has no url");
        }
        artifact.url = *url;
        artifact.signature = optionalString(entry, "signature");
        artifact.sha256 = optionalString(entry, "sha256");
        manifest.platforms.emplace(key, std::move(artifact));
    }
    return manifest;
}

std::optional<std::pair<std::string, PlatformArtifact>>
UpdateManifest::findPlatform(const std::vector<std::string>& targets) const {
    for (const auto& target : targets) {
        auto it = platforms.find(target);
        if (it != platforms.end()) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<std::string> UpdateManifest::targetsFor(const std::string& arch) {
    return {"linux-" + arch + "-appimage", "linux-" + arch};
}

} // namespace configdesk
