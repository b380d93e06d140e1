#include "repetition.h"
#include <QHash>
#include <QList>

namespace {

struct WindowConfig {
    int maxPatternLength;
    int lastTokensToConsider;
};

constexpr WindowConfig kWindows[] = {
    {1, 10},
    {10, 30},
    {20, 45},
    {30, 60},
};

// KMP failure function: prefix[i] is the length of the longest proper prefix
// of s[0..i] that is also a suffix of it.
QList<int> prefixFunction(const QStringList& s)
{
    QList<int> prefix(s.size(), 0);
    for (int i = 1; i < s.size(); ++i) {
        int k = prefix[i - 1];
        while (k > 0 && s[i] != s[k])
            k = prefix[k - 1];
        if (s[i] == s[k])
            ++k;
        prefix[i] = k;
    }
    return prefix;
}

// `reversed` holds the tokens newest first, so a short period in a window
// starting at 0 means the stream ends in a loop.
bool isRepeatedPattern(const QStringList& reversed)
{
    const QList<int> prefix = prefixFunction(reversed);
    for (const auto& window : kWindows) {
        if (reversed.size() < window.lastTokensToConsider)
            continue;
        const int last = window.lastTokensToConsider - 1;
        const int patternLength = window.lastTokensToConsider - prefix[last];
        if (patternLength <= window.maxPatternLength)
            return true;
    }
    return false;
}

}

namespace Repetition {

bool isRepetitive(const QStringList& tokens)
{
    QStringList reversed;
    QStringList reversedNonBlank;
    reversed.reserve(tokens.size());
    for (auto it = tokens.crbegin(); it != tokens.crend(); ++it) {
        reversed.append(*it);
        if (!it->trimmed().isEmpty())
            reversedNonBlank.append(*it);
    }
    return isRepeatedPattern(reversed) || isRepeatedPattern(reversedNonBlank);
}

LineRepetitionStats lineRepetitionStats(const QString& text)
{
    LineRepetitionStats stats;
    if (text.isEmpty())
        return stats;

    const QStringList lines = text.split(QLatin1Char('\n'));
    stats.totalLines = lines.size();

    QHash<QString, int> counts;
    for (const QString& raw : lines) {
        const QString line = raw.trimmed();
        if (line.isEmpty())
            continue;
        const int count = ++counts[line];
        if (count > stats.numberOfRepetitions) {
            stats.numberOfRepetitions = count;
            stats.mostRepeatedLine = line;
        }
    }
    return stats;
}

}
