#pragma once

#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <algorithm>

namespace ExecutionUtils {

inline QStringList splitArgs(const QString &args) {
    const QString trimmed = args.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    return QProcess::splitCommand(trimmed);
}

// Caps captured output at maxBytes of UTF-8, keeping the head.
inline QString truncateOutput(const QString &output, qint64 maxBytes) {
    if (maxBytes <= 0) {
        return output;
    }
    const QByteArray utf8 = output.toUtf8();
    if (utf8.size() <= maxBytes) {
        return output;
    }
    QString head = QString::fromUtf8(utf8.left(maxBytes));
    // A cut multi-byte sequence decodes to U+FFFD.
    while (head.endsWith(QChar::ReplacementCharacter)) {
        head.chop(1);
    }
    return head + QString("\n[output truncated after %1 bytes]\n").arg(maxBytes);
}

// Collects one output stream while the process runs. The first maxBytes
// are kept, then only a bounded tail, so a summary printed last still
// parses and a flooding target cannot grow server memory.
class CappedOutput {
public:
    static constexpr qint64 kMaxTailBytes = 64 * 1024;

    explicit CappedOutput(qint64 maxBytes) : maxBytes_(maxBytes) {}

    void append(const QByteArray &chunk) {
        if (chunk.isEmpty()) {
            return;
        }
        if (maxBytes_ <= 0) {
            head_ += chunk;
            return;
        }
        const qint64 room = maxBytes_ - head_.size();
        if (room >= chunk.size()) {
            head_ += chunk;
            return;
        }
        if (room > 0) {
            head_ += chunk.left(room);
        }
        tail_ += room > 0 ? chunk.mid(room) : chunk;
        const qint64 tailLimit = std::min(maxBytes_, kMaxTailBytes);
        if (tail_.size() > tailLimit) {
            tail_ = tail_.right(tailLimit);
        }
    }

    QByteArray data() const { return head_ + tail_; }
    bool overflowed() const { return !tail_.isEmpty(); }

private:
    qint64 maxBytes_;
    QByteArray head_;
    QByteArray tail_;
};

} // namespace ExecutionUtils
