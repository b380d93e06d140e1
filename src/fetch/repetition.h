#pragma once
#include <QString>
#include <QStringList>

struct LineRepetitionStats {
    QString mostRepeatedLine;
    int numberOfRepetitions = 0;
    int totalLines = 0;
};

// Loop detection over streamed completions. Both functions are pure.
namespace Repetition {
    // Line repetition count at or above which a repetition telemetry event fires.
    constexpr int kLineRepetitionReportThreshold = 10;

    // True when the tail of the token stream is a short pattern repeated
    // over a fixed window.
    bool isRepetitive(const QStringList& tokens);

    LineRepetitionStats lineRepetitionStats(const QString& text);
}
