#include "settings.h"

#include <QCommandLineParser>
#include <QDir>
#include <QStandardPaths>
#include <QThread>

#include <algorithm>

static const char s_modelRepository[] = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";

Settings::Settings()
    : modelSize(QStringLiteral("small"))
    , language(QStringLiteral("de"))
    , modelDirectory(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/models"))
    , modelBaseUrl(QString::fromLatin1(s_modelRepository))
    , threads(std::max(1, QThread::idealThreadCount()))
{
}

QStringList Settings::modelSizes()
{
    return {QStringLiteral("tiny"), QStringLiteral("base"), QStringLiteral("small"), QStringLiteral("medium"), QStringLiteral("large")};
}

bool Settings::isValidModelSize(const QString &size)
{
    return modelSizes().contains(size);
}

ParseResult parseSettings(const QStringList &arguments, Settings *settings, QString *message)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Records the microphone and transcribes it with Whisper."));
    parser.addHelpOption();

    const QCommandLineOption modelOption(QStringLiteral("model"),
                                         QStringLiteral("Model size: %1.").arg(Settings::modelSizes().join(QLatin1Char('|'))),
                                         QStringLiteral("size"), settings->modelSize);
    const QCommandLineOption languageOption(QStringLiteral("language"),
                                            QStringLiteral("Spoken language code, or \"auto\"."),
                                            QStringLiteral("code"), settings->language);
    const QCommandLineOption modelDirOption(QStringLiteral("model-dir"),
                                            QStringLiteral("Directory holding the downloaded models."),
                                            QStringLiteral("path"), settings->modelDirectory);
    const QCommandLineOption threadsOption(QStringLiteral("threads"),
                                           QStringLiteral("Inference threads."),
                                           QStringLiteral("n"), QString::number(settings->threads));
    parser.addOptions({modelOption, languageOption, modelDirOption, threadsOption});

    if (!parser.parse(arguments)) {
        *message = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        *message = parser.helpText();
        return ParseResult::HelpRequested;
    }

    const QString size = parser.value(modelOption).toLower();
    if (!Settings::isValidModelSize(size)) {
        *message = QStringLiteral("Unknown model size \"%1\", expected one of %2")
                       .arg(size, Settings::modelSizes().join(QStringLiteral(", ")));
        return ParseResult::Error;
    }

    const QString language = parser.value(languageOption).trimmed().toLower();
    if (language.isEmpty()) {
        *message = QStringLiteral("Language must not be empty");
        return ParseResult::Error;
    }

    bool ok = false;
    const int threads = parser.value(threadsOption).toInt(&ok);
    if (!ok || threads < 1) {
        *message = QStringLiteral("Invalid thread count \"%1\"").arg(parser.value(threadsOption));
        return ParseResult::Error;
    }

    const QString modelDirectory = parser.value(modelDirOption);
    if (modelDirectory.isEmpty()) {
        *message = QStringLiteral("Model directory must not be empty");
        return ParseResult::Error;
    }

    settings->modelSize = size;
    settings->language = language;
    settings->modelDirectory = QDir::cleanPath(modelDirectory);
    settings->threads = threads;
    return ParseResult::Ok;
}
