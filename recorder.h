#pragma once

#include <QAudioFormat>
#include <QByteArray>
#include <QIODevice>
#include <QMetaType>
#include <QVector>

// Mono float samples at SampleRate.
class AudioBuffer : public QVector<float>
{
public:
    static constexpr int SampleRate = 16000;

    // milliseconds
    quint64 duration() const;
    double seconds() const;
};

Q_DECLARE_METATYPE(AudioBuffer);

// Writes outside begin()/finish() are dropped.
class AudioRecorder : public QIODevice
{
    Q_OBJECT
public:
    AudioRecorder(QObject *parent = nullptr);

    qint64 readData(char *data, qint64 maxlen) override;
    qint64 writeData(const char *data, qint64 len) override;

    static QAudioFormat requiredFormat();

    // The format the device actually delivers, when it could not honour requiredFormat()
    bool setInputFormat(const QAudioFormat &format);
    QAudioFormat inputFormat() const;

    void begin();
    AudioBuffer finish();

    bool recording() const;

Q_SIGNALS:
    void levelChanged(qreal value);

private:
    void appendFrames(const char *data, qint64 frames);
    void updateLevel(float sample);

    QAudioFormat m_format;
    QByteArray m_partialFrame;
    QVector<float> m_samples;
    bool m_recording = false;

    float m_levelSum = 0;
    int m_levelCount = 0;
};
