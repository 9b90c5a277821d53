#include "relq/core/query_context.hpp"

#include <stdexcept>

namespace relq {

QueryContext::QueryContext(QueryContextConfig config)
    : config_{config}
{
    if (config_.schema == nullptr) {
        throw std::invalid_argument{"QueryContext requires a schema model"};
    }
    if (config_.executor == nullptr) {
        throw std::invalid_argument{"QueryContext requires a transaction executor"};
    }
}

}  // namespace relq
