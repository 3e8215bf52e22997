#pragma once

#include "transcriber.h"

#include <QByteArray>

struct whisper_context;

// The context is loaded on first use and kept until the model path changes.
class WhisperEngine : public SpeechEngine
{
public:
    // Throws std::invalid_argument for a language whisper does not know
    WhisperEngine(const QString &language, int threads);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine &) = delete;
    WhisperEngine &operator=(const WhisperEngine &) = delete;

    QString transcribe(const QString &modelPath, const AudioBuffer &buffer) override;

private:
    void load(const QString &modelPath);

    QByteArray m_language;
    int m_threads;

    QString m_modelPath;
    whisper_context *m_ctx = nullptr;
};
