#include "sampledatabackend.h"
#include <utility>

QString SampleDataBackend::sampleListing() {
    return QString::fromUtf8(
        "\n"
        "⇓    1234  /Downloads/ubuntu-22.04.iso  45.2% of  3.54 GB ACTIVE\n"
        "↑    5678  /Uploads/video.mp4  78.5% of  1.23 GB ACTIVE\n"
        "⇓    9012  /Downloads/document.pdf  0.0% of  15.2 MB QUEUED\n"
        "⇓    3456  /Downloads/large_archive.zip  12.8% of  8.91 GB RETRYING\n");
}

void SampleDataBackend::listTransfers(int limit, int pathDisplaySize, Callback done) {
    Q_UNUSED(limit);
    Q_UNUSED(pathDisplaySize);
    CommandResult result;
    result.started = true;
    result.exitCode = 0;
    result.stdOut = sampleListing();
    reply(0, result, std::move(done));
}
