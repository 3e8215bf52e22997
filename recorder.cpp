#include "recorder.h"

#include "diktat_debug.h"

#include <QtEndian>

#include <cmath>
#include <cstring>

// size of the window the input level is averaged over
static const int s_levelWindowMs = 200;

quint64 AudioBuffer::duration() const
{
    return (size() * 1000.0) / SampleRate;
}

double AudioBuffer::seconds() const
{
    return double(size()) / SampleRate;
}

static bool isSupported(const QAudioFormat &format)
{
    if (format.channelCount() < 1 || format.sampleRate() <= 0) {
        return false;
    }
    if (format.byteOrder() != QAudioFormat::LittleEndian) {
        return false;
    }
    return (format.sampleType() == QAudioFormat::Float && format.sampleSize() == 32)
        || (format.sampleType() == QAudioFormat::SignedInt && format.sampleSize() == 16);
}

// linear interpolation, good enough for speech going into whisper
static QVector<float> resample(const QVector<float> &input, int fromRate, int toRate)
{
    if (fromRate == toRate || input.isEmpty()) {
        return input;
    }

    const double ratio = double(fromRate) / toRate;
    const int outputSize = int(std::floor(input.size() / ratio));
    QVector<float> output;
    output.reserve(outputSize);

    for (int i = 0; i < outputSize; i++) {
        const double position = i * ratio;
        const int index = int(position);
        const double fraction = position - index;
        const float a = input[index];
        const float b = index + 1 < input.size() ? input[index + 1] : a;
        output.append(float(a + (b - a) * fraction));
    }
    return output;
}

AudioRecorder::AudioRecorder(QObject *parent)
    : QIODevice(parent)
    , m_format(requiredFormat())
{
    qRegisterMetaType<AudioBuffer>();
    open(QIODevice::WriteOnly);
}

QAudioFormat AudioRecorder::requiredFormat()
{
    QAudioFormat format;
    format.setSampleRate(AudioBuffer::SampleRate);
    format.setChannelCount(1);
    format.setSampleSize(32);
    format.setSampleType(QAudioFormat::Float);
    format.setByteOrder(QAudioFormat::LittleEndian);
    format.setCodec(QStringLiteral("audio/pcm"));
    return format;
}

bool AudioRecorder::setInputFormat(const QAudioFormat &format)
{
    if (!isSupported(format)) {
        qCWarning(DIKTAT) << "Unsupported capture format" << format;
        return false;
    }
    if (m_recording) {
        qCWarning(DIKTAT) << "Input format changed during a recording, dropping partial frame";
    }
    m_format = format;
    m_partialFrame.clear();
    m_levelSum = 0;
    m_levelCount = 0;
    return true;
}

QAudioFormat AudioRecorder::inputFormat() const
{
    return m_format;
}

bool AudioRecorder::recording() const
{
    return m_recording;
}

void AudioRecorder::begin()
{
    m_samples.clear();
    m_samples.reserve(m_format.sampleRate() * 60);
    m_partialFrame.clear();
    m_levelSum = 0;
    m_levelCount = 0;
    m_recording = true;
}

AudioBuffer AudioRecorder::finish()
{
    AudioBuffer buffer;
    if (!m_recording) {
        return buffer;
    }

    m_recording = false;
    m_partialFrame.clear();

    static_cast<QVector<float> &>(buffer) = resample(m_samples, m_format.sampleRate(), AudioBuffer::SampleRate);
    m_samples.clear();
    m_samples.squeeze();

    Q_EMIT levelChanged(0);
    return buffer;
}

qint64 AudioRecorder::readData(char *, qint64)
{
    return 0;
}

qint64 AudioRecorder::writeData(const char *data, qint64 len)
{
    if (!m_recording) {
        return len;
    }

    const int frameBytes = m_format.channelCount() * m_format.sampleSize() / 8;

    const char *input = data;
    qint64 available = len;
    QByteArray joined;
    if (!m_partialFrame.isEmpty()) {
        joined = m_partialFrame;
        joined.append(data, int(len));
        input = joined.constData();
        available = joined.size();
    }

    const qint64 frames = available / frameBytes;
    appendFrames(input, frames);
    m_partialFrame = QByteArray(input + frames * frameBytes, int(available - frames * frameBytes));
    return len;
}

void AudioRecorder::appendFrames(const char *data, qint64 frames)
{
    const int channels = m_format.channelCount();
    const bool isFloat = m_format.sampleType() == QAudioFormat::Float;

    for (qint64 frame = 0; frame < frames; frame++) {
        float mixed = 0;
        for (int channel = 0; channel < channels; channel++) {
            if (isFloat) {
                const quint32 bits = qFromLittleEndian<quint32>(data);
                float value;
                std::memcpy(&value, &bits, sizeof(float));
                mixed += value;
                data += sizeof(float);
            } else {
                mixed += qFromLittleEndian<qint16>(data) / 32768.0f;
                data += sizeof(qint16);
            }
        }
        mixed /= channels;
        m_samples.append(mixed);
        updateLevel(mixed);
    }
}

void AudioRecorder::updateLevel(float sample)
{
    m_levelSum += std::fabs(sample);
    m_levelCount++;
    if (m_levelCount * 1000 >= m_format.sampleRate() * s_levelWindowMs) {
        Q_EMIT levelChanged(qMin<qreal>(1.0, m_levelSum / m_levelCount));
        m_levelSum = 0;
        m_levelCount = 0;
    }
}
