#include "whisperengine.h"

#include "diktat_debug.h"

#include <whisper.h>

#include <QElapsedTimer>

#include <stdexcept>

static void forwardWhisperLog(enum ggml_log_level level, const char *text, void *)
{
    if (level == GGML_LOG_LEVEL_ERROR) {
        qCWarning(DIKTAT).noquote() << "whisper:" << QByteArray(text).trimmed();
    } else {
        qCDebug(DIKTAT).noquote() << "whisper:" << QByteArray(text).trimmed();
    }
}

WhisperEngine::WhisperEngine(const QString &language, int threads)
    : m_language(language.toLatin1())
    , m_threads(threads)
{
    if (m_language != "auto" && whisper_lang_id(m_language.constData()) < 0) {
        throw std::invalid_argument("Unknown language: " + m_language.toStdString());
    }
    whisper_log_set(forwardWhisperLog, nullptr);
}

WhisperEngine::~WhisperEngine()
{
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

void WhisperEngine::load(const QString &modelPath)
{
    if (m_ctx && modelPath == m_modelPath) {
        return;
    }

    if (m_ctx) {
        whisper_free(m_ctx);
        m_ctx = nullptr;
        m_modelPath.clear();
    }

    QElapsedTimer bench;
    bench.start();

    whisper_context_params cparams = whisper_context_default_params();
    const QByteArray path = modelPath.toLocal8Bit();
    m_ctx = whisper_init_from_file_with_params(path.constData(), cparams);
    if (!m_ctx) {
        throw std::runtime_error("Modell konnte nicht geladen werden: " + path.toStdString());
    }
    m_modelPath = modelPath;

    qCInfo(DIKTAT) << "Loaded" << modelPath << "in" << bench.elapsed() << "ms";
}

QString WhisperEngine::transcribe(const QString &modelPath, const AudioBuffer &buffer)
{
    if (buffer.isEmpty()) {
        return QString();
    }

    load(modelPath);

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_context       = true;
    wparams.language         = m_language.constData();
    wparams.n_threads        = m_threads;

    if (whisper_full(m_ctx, wparams, buffer.constData(), buffer.size()) != 0) {
        throw std::runtime_error("Transkription fehlgeschlagen");
    }

    QString output;
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        output += QString::fromUtf8(whisper_full_get_segment_text(m_ctx, i));
    }
    return output;
}
