#pragma once

#include <cpprom/cpprom.hpp>

struct Metrics {
    cpprom::MetricFamily<cpprom::Counter>& shiftsAppended;
    cpprom::MetricFamily<cpprom::Counter>& appendsRejected;
    cpprom::MetricFamily<cpprom::Counter>& bonusUpdates;
    cpprom::MetricFamily<cpprom::Counter>& malformedLines;
    cpprom::MetricFamily<cpprom::Counter>& fileWrites;
    cpprom::MetricFamily<cpprom::Histogram>& fileReadDuration;

    static Metrics& get();
};
