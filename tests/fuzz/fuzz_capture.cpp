#include "tsg_capture.hpp"
#include "tsg_guard_detector.hpp"
#include <cstdint>
#include <cstddef>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static tsg::TelemetryCapture capture;
    static tsg::GuardDetector detector{tsg::GuardConfig{}};

    // Raw bytes straight into envelope parsing; never throws
    std::string_view raw(reinterpret_cast<const char*>(data), size);
    tsg::CaptureResult result = capture.ingest(raw);

    // Accepted records must classify without throwing
    if (result.accepted()) {
        tsg::Verdict v = detector.process(*result.record);
        (void)v.flagged();
    }
    return 0;
}
