#ifndef AUDIOSOURCE_H
#define AUDIOSOURCE_H

#include <QAudioDeviceInfo>
#include <QAudioInput>
#include <QObject>
#include <QScopedPointer>
#include <QStringList>

class AudioRecorder;

/**
 * Something that can feed captured audio into an AudioRecorder.
 */
class AudioSource : public QObject
{
    Q_OBJECT
public:
    using QObject::QObject;

    virtual QStringList deviceNames() const = 0;
    virtual QString currentDevice() const = 0;
    virtual void setDevice(const QString &name) = 0;

    /**
     * Starts delivering audio into @p sink. Returns false if the microphone
     * is unavailable, errorString() then says why.
     */
    virtual bool start(AudioRecorder *sink) = 0;
    virtual void stop() = 0;

    QString errorString() const;

Q_SIGNALS:
    // the device went away or broke while capturing
    void failed(const QString &message);

protected:
    void setErrorString(const QString &message);

private:
    QString m_errorString;
};

class DeviceAudioSource : public AudioSource
{
    Q_OBJECT
public:
    explicit DeviceAudioSource(QObject *parent = nullptr);
    ~DeviceAudioSource() override;

    QStringList deviceNames() const override;
    QString currentDevice() const override;
    void setDevice(const QString &name) override;

    bool start(AudioRecorder *sink) override;
    void stop() override;

private:
    void handleStateChanged(QAudio::State state);

    QList<QAudioDeviceInfo> m_devices;
    QAudioDeviceInfo m_deviceInfo;
    QScopedPointer<QAudioInput> m_audioInput;
    bool m_stopping = false;
};

#endif // AUDIOSOURCE_H
