#include "relq/query/query.hpp"

namespace relq::query {

std::string describe(const Query& query)
{
    std::string text = "select from " + query.table + " where " + describe(query.where);
    if (!query.order_by.empty()) {
        text.append(" order by ");
        for (std::size_t i = 0U; i < query.order_by.size(); ++i) {
            if (i > 0U) {
                text.append(", ");
            }
            text.append(query.order_by[i].column);
            text.append(query.order_by[i].direction == SortDirection::Ascending ? " asc" : " desc");
        }
    }
    if (query.skip > 0U) {
        text.append(" skip " + std::to_string(query.skip));
    }
    if (query.take.has_value()) {
        text.append(" take " + std::to_string(*query.take));
    }
    return text;
}

}  // namespace relq::query
