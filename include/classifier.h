#ifndef __CLASSIFIER_H__
#define __CLASSIFIER_H__

#include <string>

#include "cert_types.h"

namespace chkcert
{
    // Turns a probe outcome into the record carried through the pipeline.
    // A failed probe gets now as both timestamps so it still sorts.
    CheckResult Classify(const std::string& hostname, const ProbeOutcome& outcome, TimePoint now);
} // namespace chkcert

#endif
