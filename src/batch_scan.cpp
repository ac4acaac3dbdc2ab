#include "batch_scan.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

#include "json_utils.hpp"

namespace aegis {

CoutToCerr::CoutToCerr() : saved_(std::cout.rdbuf(std::cerr.rdbuf())) {}

CoutToCerr::~CoutToCerr() {
    std::cout.rdbuf(saved_);
}

int run_batch_scan(const std::vector<std::string>& paths,
                   DetectionPipeline& pipeline,
                   bool analyst_enabled,
                   std::ostream& results) {
    results.flush();
    std::ostream out(results.rdbuf());
    CoutToCerr redirect;

    int failures = 0;
    for (const auto& path : paths) {
        std::ifstream f(path, std::ios::binary);
        if (!f) {
            std::cerr << "[ERROR] Cannot open " << path << std::endl;
            ++failures;
            continue;
        }
        ScanRequest req;
        req.filename = path;
        req.body.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());

        try {
            auto result = pipeline.process(req);
            out << dump_json(to_json(result, analyst_enabled)) << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << path << ": " << e.what() << std::endl;
            ++failures;
        }
    }
    return failures;
}

}  // namespace aegis
