#pragma once

// ============================================================================
// AppSettingsTests - Unit tests for settings persistence and presets
// ============================================================================

#include "AppSettings.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

/**
 * Unit tests for AppSettings.
 * Run with: pageforge --test-settings
 */
class AppSettingsTests : public QObject {
    Q_OBJECT

private:
    static EnhancementParameters params(qreal c, qreal b, qreal s, bool gray)
    {
        EnhancementParameters p;
        p.contrast = c;
        p.brightness = b;
        p.sharpness = s;
        p.grayscale = gray;
        return p;
    }

private slots:
    void testDefaults() {
        AppSettings settings = AppSettings::defaults();

        QCOMPARE(settings.current, EnhancementParameters());
        QCOMPARE(settings.presetNames(),
                 QStringList({"Dark Notes Fix", "Print Clear", "Read on Screen"}));
        QCOMPARE(settings.preset("Print Clear"), params(1.3, 1.05, 1.1, true));
        QCOMPARE(settings.preset("Dark Notes Fix"), params(1.6, 1.2, 1.0, true));
        QCOMPARE(settings.preset("Read on Screen"), params(1.1, 1.1, 1.0, false));
        QCOMPARE(settings.preset(AppSettings::AUTO_OPTIMIZE_PRESET),
                 AppSettings::autoOptimizeParameters());
    }

    void testMissingFileGivesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        AppSettings settings = AppSettings::load(dir.filePath("nope/settings.json"));
        QCOMPARE(settings.presetNames().size(), 3);
        QCOMPARE(settings.current, EnhancementParameters());
    }

    void testMalformedFileGivesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("settings.json");

        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ this is not json");
        file.close();

        AppSettings settings = AppSettings::load(path);
        QVERIFY(settings.hasPreset("Print Clear"));
        QCOMPARE(settings.current, EnhancementParameters());
    }

    void testSaveAndLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("config/settings.json");

        AppSettings settings = AppSettings::defaults();
        settings.current = params(1.5, 0.9, 2.0, false);
        settings.lastFolder = "/scans/2024";
        settings.savePreset("Mine", params(1.4, 1.0, 1.2, true));
        settings.lastPreset = "Mine";
        QVERIFY(settings.save(path));
        QVERIFY(QFile::exists(path));

        AppSettings reloaded = AppSettings::load(path);
        QCOMPARE(reloaded.current, settings.current);
        QCOMPARE(reloaded.lastFolder, QString("/scans/2024"));
        QCOMPARE(reloaded.lastPreset, QString("Mine"));
        QCOMPARE(reloaded.presetNames(), settings.presetNames());
        QCOMPARE(reloaded.preset("Mine"), params(1.4, 1.0, 1.2, true));
    }

    void testJsonKeys() {
        AppSettings settings = AppSettings::defaults();
        QJsonObject obj = settings.toJson();

        for (const char* key : {"contrast", "brightness", "sharpness", "grayscale",
                                "last_folder", "presets", "last_preset"}) {
            QVERIFY2(obj.contains(key), key);
        }
        QVERIFY(obj.value("presets").toObject().contains("Print Clear"));
    }

    void testMissingKeysUseDefaults() {
        QJsonObject obj;
        obj["contrast"] = 2.0;

        AppSettings settings = AppSettings::fromJson(obj);
        QCOMPARE(settings.current.contrast, 2.0);
        QCOMPARE(settings.current.brightness, EnhancementParameters().brightness);
        QCOMPARE(settings.current.grayscale, EnhancementParameters().grayscale);
        QVERIFY(settings.presetNames().isEmpty());
    }

    void testPresetEditing() {
        AppSettings settings = AppSettings::defaults();

        settings.savePreset("Faded", params(-1.0, 1.0, 1.0, true));
        QVERIFY(settings.hasPreset("Faded"));
        QCOMPARE(settings.preset("Faded").contrast, 0.0);

        // Saving under an existing name replaces it
        settings.savePreset("Faded", params(1.7, 1.0, 1.0, true));
        QCOMPARE(settings.preset("Faded").contrast, 1.7);
        QCOMPARE(settings.presetNames().size(), 4);

        QVERIFY(settings.removePreset("Faded"));
        QVERIFY(!settings.removePreset("Faded"));
        QVERIFY(!settings.hasPreset("Faded"));

        // Unknown names fall back to defaults
        QCOMPARE(settings.preset("Unknown"), EnhancementParameters());
    }
};
