#include "audiosource.h"
#include "diktat_debug.h"
#include "mainwindow.h"
#include "settings.h"
#include "whisperengine.h"

#include <QtWidgets/QApplication>

#include <cstdio>
#include <memory>
#include <stdexcept>

int main(int argc, char **argv)
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("diktat"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));
    QApplication::setApplicationDisplayName(QStringLiteral("Diktat"));
    QApplication::setStyle(QStringLiteral("Fusion"));

    Settings settings;
    QString message;
    switch (parseSettings(QCoreApplication::arguments(), &settings, &message)) {
    case ParseResult::Ok:
        break;
    case ParseResult::HelpRequested:
        fprintf(stdout, "%s", qPrintable(message));
        return 0;
    case ParseResult::Error:
        fprintf(stderr, "%s\n", qPrintable(message));
        return 1;
    }

    std::unique_ptr<SpeechEngine> engine;
    try {
        engine.reset(new WhisperEngine(settings.language, settings.threads));
    } catch (const std::invalid_argument &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    qCInfo(DIKTAT) << "Model" << settings.modelSize << "language" << settings.language
                   << "threads" << settings.threads << "models in" << settings.modelDirectory;

    DeviceAudioSource audioSource;
    MainWindow window(settings, &audioSource, std::move(engine));
    window.show();

    return QCoreApplication::exec();
}
