#include <catch2/catch_test_macros.hpp>

#include "fakes.h"
#include "mainwindow.h"
#include "modelmanager.h"

#include <QApplication>
#include <QClipboard>
#include <QFile>
#include <QLabel>
#include <QPushButton>
#include <QTemporaryDir>
#include <QTest>
#include <QTextEdit>

namespace {

// A window wired to fakes, with a model already sitting in a temporary directory.
struct WindowFixture {
    WindowFixture()
    {
        REQUIRE(modelDir.isValid());
        settings.modelSize = QStringLiteral("tiny");
        settings.modelDirectory = modelDir.path();
        settings.modelBaseUrl = QUrl(QStringLiteral("https://example.invalid"));

        QFile model(modelDir.filePath(ModelManager::fileNameFor(settings.modelSize)));
        REQUIRE(model.open(QIODevice::WriteOnly));
        model.write("ggml");
        model.close();

        window.reset(new MainWindow(settings, &source, std::unique_ptr<SpeechEngine>(new FakeEngine(&engine))));
        window->show();

        recordButton = window->findChild<QPushButton *>(QStringLiteral("recordButton"));
        copyButton = window->findChild<QPushButton *>(QStringLiteral("copyButton"));
        clearButton = window->findChild<QPushButton *>(QStringLiteral("clearButton"));
        statusLabel = window->findChild<QLabel *>(QStringLiteral("statusLabel"));
        transcript = window->findChild<QTextEdit *>(QStringLiteral("transcriptEdit"));
        REQUIRE(recordButton);
        REQUIRE(copyButton);
        REQUIRE(clearButton);
        REQUIRE(statusLabel);
        REQUIRE(transcript);
    }

    QString status() const { return statusLabel->text(); }

    void click(QPushButton *button) { QTest::mouseClick(button, Qt::LeftButton); }

    bool waitUntilIdle() { return QTest::qWaitFor([this]() { return !window->isTranscribing(); }, 5000); }

    QTemporaryDir modelDir;
    Settings settings;
    FakeAudioSource source;
    FakeEngine::State engine;
    std::unique_ptr<MainWindow> window;

    QPushButton *recordButton = nullptr;
    QPushButton *copyButton = nullptr;
    QPushButton *clearButton = nullptr;
    QLabel *statusLabel = nullptr;
    QTextEdit *transcript = nullptr;
};

} // namespace

TEST_CASE("MainWindow initial state", "[ui]") {
    WindowFixture f;

    CHECK(f.status() == QLatin1String("Bereit"));
    CHECK(f.recordButton->text().contains(QLatin1String("Aufnahme starten")));
    CHECK(f.recordButton->isEnabled());
    CHECK_FALSE(f.copyButton->isEnabled());
    CHECK(f.transcript->isReadOnly());
    CHECK(f.transcript->toPlainText().isEmpty());
}

TEST_CASE("MainWindow record toggle", "[ui]") {
    WindowFixture f;

    f.click(f.recordButton);
    REQUIRE(f.window->isRecording());
    CHECK(f.source.running);
    CHECK(f.status() == QStringLiteral("🔴 Aufnahme läuft..."));
    CHECK(f.recordButton->text().contains(QLatin1String("Aufnahme beenden")));

    f.click(f.recordButton);
    CHECK_FALSE(f.window->isRecording());
    CHECK_FALSE(f.source.running);
    CHECK(f.recordButton->text().contains(QLatin1String("Aufnahme starten")));

    REQUIRE(f.waitUntilIdle());

    CHECK(f.status() == QStringLiteral("✅ Fertig!"));
    CHECK(f.transcript->toPlainText() == QLatin1String("Hallo Welt"));
    CHECK(f.copyButton->isEnabled());
    CHECK(f.recordButton->isEnabled());

    QMutexLocker lock(&f.engine.mutex);
    REQUIRE(f.engine.modelPaths.size() == 1);
    CHECK(f.engine.modelPaths.first().endsWith(QLatin1String("ggml-tiny.bin")));
    CHECK(f.engine.sampleCounts.first() == AudioBuffer::SampleRate / 2);
}

TEST_CASE("MainWindow busy while transcribing", "[ui]") {
    WindowFixture f;
    f.engine.mutex.lock();

    // the fake engine blocks on its mutex, so the window stays busy
    f.click(f.recordButton);
    f.click(f.recordButton);

    CHECK(f.window->isTranscribing());
    CHECK(f.status() == QStringLiteral("⏳ Transkribiere... (0.5s Audio)"));
    CHECK_FALSE(f.recordButton->isEnabled());

    // a second press cannot start a recording now
    f.window->toggleRecording();
    CHECK_FALSE(f.window->isRecording());
    CHECK(f.source.started == 1);

    f.engine.mutex.unlock();
    REQUIRE(f.waitUntilIdle());
    CHECK(f.recordButton->isEnabled());
}

TEST_CASE("MainWindow empty recording", "[ui]") {
    WindowFixture f;
    f.source.samples.clear();

    f.click(f.recordButton);
    f.click(f.recordButton);

    CHECK(f.status() == QLatin1String("Keine Audio-Daten aufgenommen"));
    CHECK_FALSE(f.window->isTranscribing());
    CHECK(f.recordButton->isEnabled());

    QMutexLocker lock(&f.engine.mutex);
    CHECK(f.engine.modelPaths.isEmpty());
}

TEST_CASE("MainWindow microphone unavailable", "[ui]") {
    WindowFixture f;
    f.source.available = false;

    f.click(f.recordButton);

    CHECK_FALSE(f.window->isRecording());
    CHECK(f.status() == QStringLiteral("❌ Mikrofon-Fehler: Kein Mikrofon gefunden"));
    CHECK(f.recordButton->text().contains(QLatin1String("Aufnahme starten")));
    CHECK(f.recordButton->isEnabled());
}

TEST_CASE("MainWindow microphone lost while recording", "[ui]") {
    WindowFixture f;

    f.click(f.recordButton);
    REQUIRE(f.window->isRecording());

    f.source.breakDevice(QStringLiteral("Mikrofon nicht verfügbar"));

    CHECK_FALSE(f.window->isRecording());
    CHECK_FALSE(f.source.running);
    CHECK(f.status() == QStringLiteral("❌ Mikrofon-Fehler: Mikrofon nicht verfügbar"));
    CHECK_FALSE(f.window->isTranscribing());
}

TEST_CASE("MainWindow transcription error", "[ui]") {
    WindowFixture f;
    f.engine.error = QStringLiteral("Transkription fehlgeschlagen");

    f.click(f.recordButton);
    f.click(f.recordButton);
    REQUIRE(f.waitUntilIdle());

    CHECK(f.status() == QStringLiteral("❌ Fehler: Transkription fehlgeschlagen"));
    CHECK(f.recordButton->isEnabled());
    CHECK_FALSE(f.copyButton->isEnabled());
}

TEST_CASE("MainWindow model download failure", "[ui]") {
    WindowFixture f;
    REQUIRE(QFile::remove(f.modelDir.filePath(ModelManager::fileNameFor(f.settings.modelSize))));

    // rebuilt so the manager points at an unreachable local source
    f.settings.modelBaseUrl = QUrl::fromLocalFile(f.modelDir.filePath(QStringLiteral("nowhere")));
    f.window.reset(new MainWindow(f.settings, &f.source, std::unique_ptr<SpeechEngine>(new FakeEngine(&f.engine))));
    f.window->show();
    f.recordButton = f.window->findChild<QPushButton *>(QStringLiteral("recordButton"));
    f.statusLabel = f.window->findChild<QLabel *>(QStringLiteral("statusLabel"));

    f.click(f.recordButton);
    f.click(f.recordButton);
    REQUIRE(f.waitUntilIdle());

    CHECK(f.status().startsWith(QStringLiteral("❌ Fehler: Modell-Download fehlgeschlagen")));
    CHECK(f.recordButton->isEnabled());

    QMutexLocker lock(&f.engine.mutex);
    CHECK(f.engine.modelPaths.isEmpty());
}

TEST_CASE("MainWindow copy and clear", "[ui]") {
    WindowFixture f;

    // nothing to copy yet
    QApplication::clipboard()->setText(QStringLiteral("untouched"));
    f.window->copyAll();
    CHECK(QApplication::clipboard()->text() == QLatin1String("untouched"));
    CHECK(f.status() == QLatin1String("Bereit"));

    f.click(f.recordButton);
    f.click(f.recordButton);
    REQUIRE(f.waitUntilIdle());
    REQUIRE(f.copyButton->isEnabled());

    f.click(f.copyButton);
    CHECK(QApplication::clipboard()->text() == QLatin1String("Hallo Welt"));
    CHECK(f.status() == QStringLiteral("📋 In Zwischenablage kopiert!"));

    f.click(f.clearButton);
    CHECK(f.transcript->toPlainText().isEmpty());
    CHECK_FALSE(f.copyButton->isEnabled());
    CHECK(f.status() == QLatin1String("Bereit"));
}
