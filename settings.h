#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>

// Defaults: "small" model, German. The launch scripts pass no options.
struct Settings
{
    Settings();

    QString modelSize;
    QString language;
    QString modelDirectory;
    QUrl modelBaseUrl;
    int threads;

    static QStringList modelSizes();
    static bool isValidModelSize(const QString &size);
};

enum class ParseResult {
    Ok,
    HelpRequested,
    Error,
};

// @p arguments is argv including the program name. On HelpRequested @p message
// holds the help text, on Error the reason.
ParseResult parseSettings(const QStringList &arguments, Settings *settings, QString *message);
