/**
 * LanguageModel.cpp - Status helpers
 */

#include "gideon/llm/LanguageModel.hpp"

namespace gideon::llm {

const char* toString(ModelStatus status) {
    switch (status) {
        case ModelStatus::OK:             return "ok";
        case ModelStatus::TIMEOUT:        return "timeout";
        case ModelStatus::NETWORK_ERROR:  return "network error";
        case ModelStatus::AUTH_ERROR:     return "authentication error";
        case ModelStatus::SERVER_ERROR:   return "server error";
        case ModelStatus::BAD_RESPONSE:   return "bad response";
        case ModelStatus::NOT_CONFIGURED: return "not configured";
        case ModelStatus::CANCELLED:      return "cancelled";
    }
    return "unknown";
}

bool isTransient(ModelStatus status) {
    return status == ModelStatus::TIMEOUT ||
           status == ModelStatus::NETWORK_ERROR ||
           status == ModelStatus::SERVER_ERROR;
}

} // namespace gideon::llm
