#include "mainwindow.h"

#include "audiosource.h"
#include "diktat_debug.h"
#include "modelmanager.h"
#include "transcriber.h"

#include <QClipboard>
#include <QComboBox>
#include <QFont>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QProgressBar>
#include <QPushButton>
#include <QTextEdit>
#include <QThread>
#include <QVBoxLayout>

static const char s_startStyle[] = R"(
    QPushButton {
        background-color: #4CAF50;
        color: white;
        border: none;
        border-radius: 10px;
        font-weight: bold;
    }
    QPushButton:hover {
        background-color: #45a049;
    }
    QPushButton:pressed {
        background-color: #3d8b40;
    }
    QPushButton:disabled {
        background-color: #a5d6a7;
    }
)";

static const char s_stopStyle[] = R"(
    QPushButton {
        background-color: #f44336;
        color: white;
        border: none;
        border-radius: 10px;
        font-weight: bold;
    }
    QPushButton:hover {
        background-color: #da190b;
    }
)";

static const char s_transcriptStyle[] = R"(
    QTextEdit {
        border: 2px solid #ddd;
        border-radius: 8px;
        padding: 10px;
        background-color: #fafafa;
        color: #000000;
    }
)";

class RenderArea : public QWidget
{
    Q_OBJECT

public:
    explicit RenderArea(QWidget *parent = nullptr);

    void setLevel(qreal value);

protected:
    void paintEvent(QPaintEvent *event) override;

private:
    qreal m_level = 0;
};

RenderArea::RenderArea(QWidget *parent)
    : QWidget(parent)
{
    setBackgroundRole(QPalette::Base);
    setAutoFillBackground(true);

    setMinimumHeight(30);
    setMinimumWidth(200);
}

void RenderArea::paintEvent(QPaintEvent * /* event */)
{
    QPainter painter(this);

    painter.setPen(Qt::black);

    const QRect frame = painter.viewport() - QMargins(10, 10, 10, 10);
    painter.drawRect(frame);
    if (m_level == 0.0)
        return;

    // speech rarely goes above a quarter of full scale
    const qreal level = qMin<qreal>(1.0, m_level * 4);
    const int pos = qRound(qreal(frame.width() - 1) * level);
    painter.fillRect(frame.left() + 1, frame.top() + 1,
                     pos, frame.height() - 1, Qt::red);
}

void RenderArea::setLevel(qreal value)
{
    m_level = value;
    update();
}

MainWindow::MainWindow(const Settings &settings, AudioSource *audioSource, std::unique_ptr<SpeechEngine> engine, QWidget *parent)
    : QMainWindow(parent)
    , m_settings(settings)
    , m_audioSource(audioSource)
    , m_recorder(new AudioRecorder(this))
    , m_models(new ModelManager(settings.modelDirectory, settings.modelSize, settings.modelBaseUrl, this))
    , m_transcriber(new Transcriber(std::move(engine))) // no parent, it lives on m_transcriberThread
    , m_transcriberThread(new QThread(this))
{
    m_transcriber->moveToThread(m_transcriberThread);
    connect(m_transcriberThread, &QThread::finished, m_transcriber, &QObject::deleteLater);
    connect(m_transcriber, &Transcriber::textFound, this, &MainWindow::onTranscriptionDone);
    connect(m_transcriber, &Transcriber::failed, this, &MainWindow::onTranscriptionFailed);
    m_transcriberThread->setObjectName(QStringLiteral("transcriber"));
    m_transcriberThread->start();

    connect(m_models, &ModelManager::downloadStarted, this, [this]() {
        setStatus(QStringLiteral("⬇ Lade Modell %1...").arg(m_models->modelSize()), Tone::Busy);
        m_progress->setRange(0, 0);
    });
    connect(m_models, &ModelManager::downloadProgress, this, [this](qint64 received, qint64 total) {
        if (total <= 0) {
            return;
        }
        const int percent = int(received * 100 / total);
        if (percent == m_progress->value()) {
            return;
        }
        m_progress->setRange(0, 100);
        m_progress->setValue(percent);
        setStatus(QStringLiteral("⬇ Lade Modell %1... %2 %").arg(m_models->modelSize()).arg(percent), Tone::Busy);
    });
    connect(m_models, &ModelManager::ready, this, &MainWindow::onModelReady);
    connect(m_models, &ModelManager::failed, this, &MainWindow::onTranscriptionFailed);

    connect(m_audioSource, &AudioSource::failed, this, &MainWindow::abortRecording);

    initializeWindow();
}

MainWindow::~MainWindow()
{
    if (m_recording) {
        m_audioSource->stop();
    }
    m_transcriberThread->quit();
    m_transcriberThread->wait();
}

void MainWindow::initializeWindow()
{
    setWindowTitle(QStringLiteral("🎤 Diktat"));
    setMinimumSize(500, 400);

    QWidget *window = new QWidget;
    QVBoxLayout *layout = new QVBoxLayout;
    layout->setSpacing(15);
    layout->setContentsMargins(20, 20, 20, 20);

    m_recordButton = new QPushButton(this);
    m_recordButton->setObjectName(QStringLiteral("recordButton"));
    m_recordButton->setMinimumHeight(60);
    m_recordButton->setFont(QFont(QString(), 14));
    connect(m_recordButton, &QPushButton::clicked, this, &MainWindow::toggleRecording);
    layout->addWidget(m_recordButton);

    m_statusLabel = new QLabel(this);
    m_statusLabel->setObjectName(QStringLiteral("statusLabel"));
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setFont(QFont(QString(), 14));
    m_statusLabel->setWordWrap(true);
    layout->addWidget(m_statusLabel);

    m_levelMeter = new RenderArea(this);
    connect(m_recorder, &AudioRecorder::levelChanged, m_levelMeter, &RenderArea::setLevel);
    layout->addWidget(m_levelMeter);

    m_deviceBox = new QComboBox(this);
    m_deviceBox->setObjectName(QStringLiteral("deviceBox"));
    m_deviceBox->addItems(m_audioSource->deviceNames());
    m_deviceBox->setCurrentText(m_audioSource->currentDevice());
    connect(m_deviceBox, QOverload<int>::of(&QComboBox::activated), this, [this](int index) {
        m_audioSource->setDevice(m_deviceBox->itemText(index));
    });
    layout->addWidget(m_deviceBox);

    m_progress = new QProgressBar(this);
    m_progress->setObjectName(QStringLiteral("progressBar"));
    m_progress->setRange(0, 0);
    m_progress->hide();
    layout->addWidget(m_progress);

    m_textEdit = new QTextEdit(this);
    m_textEdit->setObjectName(QStringLiteral("transcriptEdit"));
    m_textEdit->setPlaceholderText(QStringLiteral("Das Transkript erscheint hier...\n\n"
                                                  "Du kannst Text markieren und mit Strg+C kopieren,\n"
                                                  "oder den 'Alles kopieren' Button verwenden."));
    m_textEdit->setReadOnly(true);
    m_textEdit->setAcceptRichText(false);
    m_textEdit->setFont(QFont(QString(), 14));
    m_textEdit->setStyleSheet(QString::fromLatin1(s_transcriptStyle));
    layout->addWidget(m_textEdit, 1);

    QHBoxLayout *buttons = new QHBoxLayout;

    m_copyButton = new QPushButton(QStringLiteral("📋 Alles kopieren"), this);
    m_copyButton->setObjectName(QStringLiteral("copyButton"));
    m_copyButton->setMinimumHeight(40);
    m_copyButton->setEnabled(false);
    connect(m_copyButton, &QPushButton::clicked, this, &MainWindow::copyAll);
    buttons->addWidget(m_copyButton);

    m_clearButton = new QPushButton(QStringLiteral("🗑️ Löschen"), this);
    m_clearButton->setObjectName(QStringLiteral("clearButton"));
    m_clearButton->setMinimumHeight(40);
    connect(m_clearButton, &QPushButton::clicked, this, &MainWindow::clearTranscript);
    buttons->addWidget(m_clearButton);

    layout->addLayout(buttons);

    window->setLayout(layout);
    setCentralWidget(window);

    setStatus(QStringLiteral("Bereit"), Tone::Neutral);
    updateRecordButton();
}

bool MainWindow::isRecording() const
{
    return m_recording;
}

bool MainWindow::isTranscribing() const
{
    return m_transcribing;
}

void MainWindow::toggleRecording()
{
    if (!m_recording) {
        startRecording();
    } else {
        stopRecording();
    }
}

void MainWindow::startRecording()
{
    if (m_transcribing) {
        return;
    }

    m_recorder->begin();
    if (!m_audioSource->start(m_recorder)) {
        m_recorder->finish();
        qCWarning(DIKTAT) << "Microphone unavailable:" << m_audioSource->errorString();
        setStatus(QStringLiteral("❌ Mikrofon-Fehler: %1").arg(m_audioSource->errorString()), Tone::Error);
        return;
    }

    m_recording = true;
    updateRecordButton();
    setStatus(QStringLiteral("🔴 Aufnahme läuft..."), Tone::Recording);
}

void MainWindow::stopRecording()
{
    m_recording = false;
    m_audioSource->stop();
    const AudioBuffer audio = m_recorder->finish();

    qCInfo(DIKTAT) << "Recorded" << audio.duration() << "ms of audio";

    if (audio.isEmpty()) {
        updateRecordButton();
        setStatus(QStringLiteral("Keine Audio-Daten aufgenommen"), Tone::Neutral);
        return;
    }

    m_transcribing = true;
    m_pendingBuffer = audio;
    updateRecordButton();

    setStatus(QStringLiteral("⏳ Transkribiere... (%1s Audio)").arg(audio.seconds(), 0, 'f', 1), Tone::Busy);
    m_progress->setRange(0, 0);
    m_progress->show();

    m_models->ensureAvailable();
}

void MainWindow::abortRecording(const QString &message)
{
    if (!m_recording) {
        return;
    }

    m_recording = false;
    m_audioSource->stop();
    m_recorder->finish();
    updateRecordButton();

    qCWarning(DIKTAT) << "Recording aborted:" << message;
    setStatus(QStringLiteral("❌ Mikrofon-Fehler: %1").arg(message), Tone::Error);
}

void MainWindow::onModelReady(const QString &path)
{
    if (!m_transcribing || m_pendingBuffer.isEmpty()) {
        return;
    }

    setStatus(QStringLiteral("⏳ Transkribiere... (%1s Audio)").arg(m_pendingBuffer.seconds(), 0, 'f', 1), Tone::Busy);
    m_progress->setRange(0, 0);

    m_transcriber->enqueue(path, m_pendingBuffer);
    m_pendingBuffer.clear();
}

void MainWindow::onTranscriptionDone(const QString &text)
{
    finishTranscription();
    setStatus(QStringLiteral("✅ Fertig!"), Tone::Success);

    const QString transcript = text.trimmed();
    m_textEdit->setPlainText(transcript);
    m_copyButton->setEnabled(!transcript.isEmpty());
}

void MainWindow::onTranscriptionFailed(const QString &message)
{
    if (!m_transcribing) {
        return;
    }

    finishTranscription();
    setStatus(QStringLiteral("❌ Fehler: %1").arg(message), Tone::Error);
}

void MainWindow::finishTranscription()
{
    m_transcribing = false;
    m_pendingBuffer.clear();
    m_progress->hide();
    updateRecordButton();
}

void MainWindow::copyAll()
{
    const QString text = m_textEdit->toPlainText();
    if (text.isEmpty()) {
        return;
    }

    QGuiApplication::clipboard()->setText(text);
    setStatus(QStringLiteral("📋 In Zwischenablage kopiert!"), Tone::Success);
}

void MainWindow::clearTranscript()
{
    m_textEdit->clear();
    m_copyButton->setEnabled(false);
    if (!m_recording && !m_transcribing) {
        setStatus(QStringLiteral("Bereit"), Tone::Neutral);
    }
}

void MainWindow::setStatus(const QString &text, Tone tone)
{
    m_statusLabel->setText(text);

    switch (tone) {
    case Tone::Neutral:
        m_statusLabel->setStyleSheet(QString());
        break;
    case Tone::Recording:
        m_statusLabel->setStyleSheet(QStringLiteral("color: #f44336; font-weight: bold;"));
        break;
    case Tone::Busy:
        m_statusLabel->setStyleSheet(QStringLiteral("color: #2196F3; font-weight: bold;"));
        break;
    case Tone::Success:
        m_statusLabel->setStyleSheet(QStringLiteral("color: #4CAF50; font-weight: bold;"));
        break;
    case Tone::Error:
        m_statusLabel->setStyleSheet(QStringLiteral("color: #f44336;"));
        break;
    }
}

void MainWindow::updateRecordButton()
{
    if (m_recording) {
        m_recordButton->setText(QStringLiteral("⏹ Aufnahme beenden"));
        m_recordButton->setStyleSheet(QString::fromLatin1(s_stopStyle));
    } else {
        m_recordButton->setText(QStringLiteral("🎤 Aufnahme starten"));
        m_recordButton->setStyleSheet(QString::fromLatin1(s_startStyle));
    }
    m_recordButton->setEnabled(!m_transcribing);
    m_deviceBox->setEnabled(!m_recording && !m_transcribing && m_deviceBox->count() > 0);
}

#include "mainwindow.moc"
