#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "detection_pipeline.hpp"

namespace aegis {

// Points std::cout at std::cerr for its lifetime, so [INFO] logging stays
// off stdout while results are written there.
class CoutToCerr {
public:
    CoutToCerr();
    ~CoutToCerr();
    CoutToCerr(const CoutToCerr&) = delete;
    CoutToCerr& operator=(const CoutToCerr&) = delete;

private:
    std::streambuf* saved_;
};

// Runs each file through the pipeline and writes one compact JSON result per
// line to `results`, which may be std::cout itself. The pipeline's [INFO]
// lines go to stderr while it runs. Returns the number of files that could
// not be read or processed.
int run_batch_scan(const std::vector<std::string>& paths,
                   DetectionPipeline& pipeline,
                   bool analyst_enabled,
                   std::ostream& results);

}  // namespace aegis
