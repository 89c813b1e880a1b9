#include "storage/document_store.h"

namespace docbridge {

const char* StoreStatus::errorName() const {
    switch (code) {
        case Code::Ok: return "ok";
        case Code::NotFound: return "not_found";
        case Code::Conflict: return "conflict";
        case Code::Timeout: return "timeout";
        case Code::BadRequest: return "bad_request";
        case Code::Error: return "store_error";
    }
    return "store_error";
}

} // namespace docbridge
