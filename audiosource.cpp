#include "audiosource.h"

#include "diktat_debug.h"
#include "recorder.h"

static QString describeError(QAudio::Error error)
{
    switch (error) {
    case QAudio::OpenError:
        return QStringLiteral("Mikrofon konnte nicht geöffnet werden");
    case QAudio::IOError:
        return QStringLiteral("Lesefehler am Mikrofon");
    case QAudio::UnderrunError:
        return QStringLiteral("Audiodaten kommen nicht schnell genug");
    case QAudio::FatalError:
        return QStringLiteral("Mikrofon nicht verfügbar");
    case QAudio::NoError:
        break;
    }
    return QString();
}

QString AudioSource::errorString() const
{
    return m_errorString;
}

void AudioSource::setErrorString(const QString &message)
{
    m_errorString = message;
}

DeviceAudioSource::DeviceAudioSource(QObject *parent)
    : AudioSource(parent)
{
    const QAudioDeviceInfo &defaultDeviceInfo = QAudioDeviceInfo::defaultInputDevice();
    if (!defaultDeviceInfo.isNull()) {
        m_devices.append(defaultDeviceInfo);
    }
    for (auto &deviceInfo : QAudioDeviceInfo::availableDevices(QAudio::AudioInput)) {
        if (deviceInfo != defaultDeviceInfo)
            m_devices.append(deviceInfo);
    }
    m_deviceInfo = defaultDeviceInfo;

    qCDebug(DIKTAT) << "Found" << m_devices.count() << "input devices, default" << m_deviceInfo.deviceName();
}

DeviceAudioSource::~DeviceAudioSource()
{
    stop();
}

QStringList DeviceAudioSource::deviceNames() const
{
    QStringList names;
    for (const auto &deviceInfo : m_devices) {
        names << deviceInfo.deviceName();
    }
    return names;
}

QString DeviceAudioSource::currentDevice() const
{
    return m_deviceInfo.deviceName();
}

void DeviceAudioSource::setDevice(const QString &name)
{
    for (const auto &deviceInfo : m_devices) {
        if (deviceInfo.deviceName() == name) {
            qCInfo(DIKTAT) << "Using input device" << name;
            m_deviceInfo = deviceInfo;
            return;
        }
    }
    qCWarning(DIKTAT) << "Unknown input device" << name;
}

bool DeviceAudioSource::start(AudioRecorder *sink)
{
    stop();

    if (m_deviceInfo.isNull()) {
        setErrorString(QStringLiteral("Kein Mikrofon gefunden"));
        return false;
    }

    QAudioFormat format = AudioRecorder::requiredFormat();
    if (!m_deviceInfo.isFormatSupported(format)) {
        qCWarning(DIKTAT) << "Default format not supported - trying to use nearest";
        format = m_deviceInfo.nearestFormat(format);
    }

    if (!sink->setInputFormat(format)) {
        setErrorString(QStringLiteral("Audioformat des Mikrofons wird nicht unterstützt"));
        return false;
    }

    m_audioInput.reset(new QAudioInput(m_deviceInfo, format));
    connect(m_audioInput.data(), &QAudioInput::stateChanged, this, &DeviceAudioSource::handleStateChanged);

    m_audioInput->start(sink);

    if (m_audioInput->error() != QAudio::NoError) {
        setErrorString(describeError(m_audioInput->error()));
        qCWarning(DIKTAT) << "Could not start capture on" << m_deviceInfo.deviceName() << m_audioInput->error();
        m_audioInput.take()->deleteLater();
        return false;
    }

    qCInfo(DIKTAT) << "Capturing from" << m_deviceInfo.deviceName() << format;
    setErrorString(QString());
    return true;
}

void DeviceAudioSource::stop()
{
    if (!m_audioInput) {
        return;
    }

    m_stopping = true;
    m_audioInput->stop();
    m_stopping = false;

    // may be called from a slot connected to the input's own signals
    m_audioInput.take()->deleteLater();
}

void DeviceAudioSource::handleStateChanged(QAudio::State state)
{
    qCDebug(DIKTAT) << "State changed" << state;

    if (m_stopping || state != QAudio::StoppedState || !m_audioInput || sender() != m_audioInput.data()) {
        return;
    }
    if (m_audioInput->error() != QAudio::NoError) {
        const QString message = describeError(m_audioInput->error());
        setErrorString(message);
        Q_EMIT failed(message);
    }
}
