#pragma once

#include <stdexcept>
#include <string>

namespace hazard {

// Transient errors are absorbed where they happen, Degraded ones change the
// reported status, Fatal ones stop the pipeline.
enum class ErrorClass { Transient, Degraded, Fatal };

inline const char* error_class_to_string(ErrorClass c) {
    switch (c) {
        case ErrorClass::Transient: return "transient";
        case ErrorClass::Degraded: return "degraded";
        case ErrorClass::Fatal: return "fatal";
    }
    return "transient";
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorClass cls, const std::string& what)
        : std::runtime_error(what), cls_(cls) {}

    ErrorClass error_class() const { return cls_; }

private:
    ErrorClass cls_;
};

}  // namespace hazard
