// ============================================================================
// AppSettings - Implementation
// ============================================================================

#include "AppSettings.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

const QString AppSettings::AUTO_OPTIMIZE_PRESET = QStringLiteral("Print Clear");

static EnhancementParameters makeParams(qreal contrast, qreal brightness,
                                        qreal sharpness, bool grayscale)
{
    EnhancementParameters params;
    params.contrast = contrast;
    params.brightness = brightness;
    params.sharpness = sharpness;
    params.grayscale = grayscale;
    return params;
}

static QJsonObject paramsToJson(const EnhancementParameters& params)
{
    QJsonObject obj;
    obj[QStringLiteral("contrast")] = params.contrast;
    obj[QStringLiteral("brightness")] = params.brightness;
    obj[QStringLiteral("sharpness")] = params.sharpness;
    obj[QStringLiteral("grayscale")] = params.grayscale;
    return obj;
}

// Missing keys keep their built-in default
static EnhancementParameters paramsFromJson(const QJsonObject& obj)
{
    const EnhancementParameters fallback;
    return makeParams(obj.value(QStringLiteral("contrast")).toDouble(fallback.contrast),
                      obj.value(QStringLiteral("brightness")).toDouble(fallback.brightness),
                      obj.value(QStringLiteral("sharpness")).toDouble(fallback.sharpness),
                      obj.value(QStringLiteral("grayscale")).toBool(fallback.grayscale))
        .clamped();
}

// ============================================================================
// Factory
// ============================================================================

AppSettings AppSettings::defaults()
{
    AppSettings settings;
    settings.current = EnhancementParameters();
    settings.lastFolder = QDir::currentPath();
    settings.m_presets.insert(QStringLiteral("Print Clear"), makeParams(1.3, 1.05, 1.1, true));
    settings.m_presets.insert(QStringLiteral("Dark Notes Fix"), makeParams(1.6, 1.2, 1.0, true));
    settings.m_presets.insert(QStringLiteral("Read on Screen"), makeParams(1.1, 1.1, 1.0, false));
    settings.lastPreset = AUTO_OPTIMIZE_PRESET;
    return settings;
}

EnhancementParameters AppSettings::autoOptimizeParameters()
{
    return makeParams(1.3, 1.05, 1.1, true);
}

// ============================================================================
// Persistence
// ============================================================================

QString AppSettings::defaultPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QStringLiteral("settings.json"));
}

QJsonObject AppSettings::toJson() const
{
    QJsonObject obj = paramsToJson(current);
    obj[QStringLiteral("last_folder")] = lastFolder;
    obj[QStringLiteral("last_preset")] = lastPreset;

    QJsonObject presets;
    for (auto it = m_presets.constBegin(); it != m_presets.constEnd(); ++it) {
        presets[it.key()] = paramsToJson(it.value());
    }
    obj[QStringLiteral("presets")] = presets;
    return obj;
}

AppSettings AppSettings::fromJson(const QJsonObject& obj)
{
    AppSettings settings;
    settings.current = paramsFromJson(obj);
    settings.lastFolder = obj.value(QStringLiteral("last_folder")).toString(QDir::currentPath());
    settings.lastPreset = obj.value(QStringLiteral("last_preset")).toString();

    const QJsonObject presets = obj.value(QStringLiteral("presets")).toObject();
    for (auto it = presets.constBegin(); it != presets.constEnd(); ++it) {
        if (it.value().isObject()) {
            settings.m_presets.insert(it.key(), paramsFromJson(it.value().toObject()));
        }
    }
    return settings;
}

AppSettings AppSettings::load(const QString& path)
{
    QFile file(path);
    if (!file.exists()) {
        qDebug() << "[AppSettings] No settings at" << path << "- using defaults";
        return defaults();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[AppSettings] Cannot read" << path << "- using defaults";
        return defaults();
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[AppSettings] JSON parse error in" << path << ":"
                   << parseError.errorString() << "- using defaults";
        return defaults();
    }

    return fromJson(doc.object());
}

bool AppSettings::save(const QString& path) const
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "[AppSettings] Cannot create folder" << info.absolutePath();
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[AppSettings] Failed to open" << path << ":" << file.errorString();
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[AppSettings] Failed to save to" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

// ============================================================================
// Presets
// ============================================================================

EnhancementParameters AppSettings::preset(const QString& name) const
{
    return m_presets.value(name, EnhancementParameters());
}

void AppSettings::savePreset(const QString& name, const EnhancementParameters& params)
{
    m_presets.insert(name, params.clamped());
}

bool AppSettings::removePreset(const QString& name)
{
    return m_presets.remove(name) > 0;
}
