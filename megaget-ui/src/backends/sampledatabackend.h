#ifndef SAMPLEDATABACKEND_H
#define SAMPLEDATABACKEND_H

#include "simulatedbackend.h"

// UI_TEST_MODE=1: same canned control responses as the simulated backend,
// but the listing is realistic native mega-transfers output covering both
// directions and the ACTIVE / QUEUED / RETRYING states.

class SampleDataBackend : public SimulatedBackend {
    Q_OBJECT
public:
    using SimulatedBackend::SimulatedBackend;

    QString name() const override { return "sample data"; }

    void listTransfers(int limit, int pathDisplaySize, Callback done) override;

    static QString sampleListing();
};

#endif
