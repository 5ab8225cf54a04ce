#pragma once

// ============================================================================
// AppSettings - Persistent enhancement settings and named presets
// ============================================================================
// Stored as a small JSON file:
//
//   {
//     "contrast": 1.2, "brightness": 1.0, "sharpness": 1.0, "grayscale": true,
//     "last_folder": "/home/me/scans",
//     "presets": { "Print Clear": { "contrast": 1.3, ... }, ... },
//     "last_preset": "Print Clear"
//   }
//
// A missing or unreadable file falls back to built-in defaults.
// ============================================================================

#include "EnhancementPipeline.h"

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

/**
 * @brief Settings record: current parameters, last folder and presets.
 */
class AppSettings {
public:
    EnhancementParameters current;      ///< Parameters used when nothing else is given
    QString lastFolder;                 ///< Folder of the last opened/saved file
    QString lastPreset;                 ///< Name of the last applied preset

    /// Name of the preset applied by auto-optimize.
    static const QString AUTO_OPTIMIZE_PRESET;

    // ===== Factory =====

    /**
     * @brief Built-in defaults, including the three stock presets.
     */
    static AppSettings defaults();

    // ===== Persistence =====

    /**
     * @brief Load settings from @p path.
     *
     * Missing, unreadable or malformed files yield defaults() with a warning.
     */
    static AppSettings load(const QString& path);

    /**
     * @brief Write settings to @p path atomically.
     * @return False if the file could not be written.
     */
    bool save(const QString& path) const;

    /// settings.json under the application config directory.
    static QString defaultPath();

    QJsonObject toJson() const;
    static AppSettings fromJson(const QJsonObject& obj);

    // ===== Presets =====

    bool hasPreset(const QString& name) const { return m_presets.contains(name); }

    /**
     * @brief Parameters of a named preset, or defaults if it does not exist.
     */
    EnhancementParameters preset(const QString& name) const;

    /// Add or replace a preset.
    void savePreset(const QString& name, const EnhancementParameters& params);

    /// @return True if a preset was removed.
    bool removePreset(const QString& name);

    /// Preset names in sorted order.
    QStringList presetNames() const { return m_presets.keys(); }

    /// Parameters applied by "auto optimize for print".
    static EnhancementParameters autoOptimizeParameters();

private:
    QMap<QString, EnhancementParameters> m_presets;
};
