#include "ErrorClassifier.hpp"
#include <spdlog/spdlog.h>

namespace strata_mcp {

json ClassifiedError::to_json() const {
    json data = {{"kind", std::string(ErrorClassifier::to_string(kind))}};
    if (!field.empty()) {
        data["field"] = field;
    }
    return {
        {"code", ErrorClassifier::code_for(kind)},
        {"message", message},
        {"data", data}
    };
}

ClassifiedError ErrorClassifier::classify(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const ToolError& e) {
        return {e.kind(), e.what(), e.field()};
    } catch (const EngineError& e) {
        return {kind_for(e.code()), e.what(), {}};
    } catch (const json::exception& e) {
        // Arguments are validated before handlers run, so this is a bug
        spdlog::error("Unexpected JSON error: {}", e.what());
        return {ErrorKind::Internal, std::string("Internal error: ") + e.what(), {}};
    } catch (const std::exception& e) {
        spdlog::error("Unclassified failure: {}", e.what());
        return {ErrorKind::Internal, std::string("Internal error: ") + e.what(), {}};
    } catch (...) {
        spdlog::error("Unclassified non-standard exception");
        return {ErrorKind::Internal, "Internal error: unknown failure", {}};
    }
}

ErrorKind ErrorClassifier::kind_for(EngineErrc code) {
    switch (code) {
        case EngineErrc::BranchNotFound:
        case EngineErrc::KeyNotFound:
            return ErrorKind::NotFound;
        case EngineErrc::BranchExists:
        case EngineErrc::InvalidInput:
            return ErrorKind::InvalidArgument;
        case EngineErrc::ReadOnly:
            return ErrorKind::AccessDenied;
        case EngineErrc::Io:
        case EngineErrc::Unavailable:
        case EngineErrc::Internal:
            return ErrorKind::EngineError;
    }
    return ErrorKind::EngineError;
}

int ErrorClassifier::code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:      return -32700;
        case ErrorKind::MethodNotFound:  return -32601;
        case ErrorKind::InvalidArgument: return -32602;
        case ErrorKind::Internal:        return -32603;
        case ErrorKind::ToolNotFound:    return -32001;
        case ErrorKind::AccessDenied:    return -32002;
        case ErrorKind::NotFound:        return -32003;
        case ErrorKind::EngineError:     return -32004;
    }
    return -32603;
}

std::string_view ErrorClassifier::to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:      return "ParseError";
        case ErrorKind::MethodNotFound:  return "MethodNotFound";
        case ErrorKind::ToolNotFound:    return "ToolNotFound";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::AccessDenied:    return "AccessDenied";
        case ErrorKind::NotFound:        return "NotFound";
        case ErrorKind::EngineError:     return "EngineError";
        case ErrorKind::Internal:        return "Internal";
    }
    return "Internal";
}

} // namespace strata_mcp
