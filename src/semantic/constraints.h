#pragma once
#include <QString>
#include <QStringList>
#include <optional>

// Sampling parameters shared by the standard request and the native
// parameter bag. An unset optional means the caller never sent the field.
struct SamplingParameters {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> maxTokens;
    std::optional<double> presencePenalty;
    std::optional<double> frequencyPenalty;
    QStringList stop;

    bool isEmpty() const {
        return !temperature && !topP && !maxTokens
            && !presencePenalty && !frequencyPenalty && stop.isEmpty();
    }
};
