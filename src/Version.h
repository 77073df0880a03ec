#pragma once

#include <QString>

namespace PairBench {

// Reported by --version and the server's startup log line.
inline constexpr auto kVersion = "0.3.0";

inline QString versionString() {
    return QStringLiteral("v") + QString::fromLatin1(kVersion);
}

} // namespace PairBench
