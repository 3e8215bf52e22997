#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "recorder.h"
#include "settings.h"

#include <QMainWindow>

#include <memory>

class AudioSource;
class ModelManager;
class RenderArea;
class SpeechEngine;
class Transcriber;

class QComboBox;
class QLabel;
class QProgressBar;
class QPushButton;
class QTextEdit;
class QThread;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @p audioSource is not owned. The engine is handed to the transcriber
     * thread and destroyed there.
     */
    MainWindow(const Settings &settings, AudioSource *audioSource, std::unique_ptr<SpeechEngine> engine, QWidget *parent = nullptr);
    ~MainWindow() override;

    bool isRecording() const;
    bool isTranscribing() const;

public Q_SLOTS:
    void toggleRecording();
    void copyAll();
    void clearTranscript();

private:
    enum class Tone {
        Neutral,
        Recording,
        Busy,
        Success,
        Error,
    };

    void initializeWindow();
    void startRecording();
    void stopRecording();
    void abortRecording(const QString &message);

    void onModelReady(const QString &path);
    void onTranscriptionDone(const QString &text);
    void onTranscriptionFailed(const QString &message);
    void finishTranscription();

    void setStatus(const QString &text, Tone tone);
    void updateRecordButton();

    Settings m_settings;
    AudioSource *m_audioSource;
    AudioRecorder *m_recorder;
    ModelManager *m_models;
    Transcriber *m_transcriber;
    QThread *m_transcriberThread;

    AudioBuffer m_pendingBuffer;
    bool m_recording = false;
    bool m_transcribing = false;

    QPushButton *m_recordButton = nullptr;
    QLabel *m_statusLabel = nullptr;
    RenderArea *m_levelMeter = nullptr;
    QComboBox *m_deviceBox = nullptr;
    QProgressBar *m_progress = nullptr;
    QTextEdit *m_textEdit = nullptr;
    QPushButton *m_copyButton = nullptr;
    QPushButton *m_clearButton = nullptr;
};

#endif // MAINWINDOW_H
