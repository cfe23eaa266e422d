#ifndef MAILCAS_HISTORY_QUERY_HPP
#define MAILCAS_HISTORY_QUERY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "store/records.h"

namespace mailcas {

enum class SortField {
  DATE,    ///< effectiveDate
  SUBJECT, ///< subject, case-insensitive
  SENDER   ///< displaySender, case-insensitive
};

enum class SortDirection { ASCENDING, DESCENDING };

struct SortOrder {
  SortField field = SortField::DATE;
  SortDirection direction = SortDirection::DESCENDING;
};

/**
 * @brief Conjunction of optional predicates; unset fields do not constrain.
 */
struct EmailFilter {
  std::optional<bool> hasAttachments;
  std::optional<int64_t> dateFrom; ///< inclusive, against effectiveDate
  std::optional<int64_t> dateTo;   ///< inclusive, against effectiveDate
  std::optional<std::string> senderContains; ///< senderEmail OR senderName

  bool isEmpty() const {
    return !hasAttachments && !dateFrom && !dateTo && !senderContains;
  }
};

/**
 * @brief Search text AND filter, then ordering.
 *
 * Without a sort the result uses the search order: effectiveDate descending,
 * then id descending.
 */
struct HistoryQuery {
  std::string text;
  EmailFilter filter;
  std::optional<SortOrder> sort;
};

using RecordList = std::vector<HistoryRecord>;

namespace query {

/// True if @p text is blank or any searchable field contains it.
bool matchesSearch(const HistoryRecord &record, const std::string &text);

bool matchesFilter(const HistoryRecord &record, const EmailFilter &filter);

/// Newest effectiveDate first, ties by id descending.
void orderBySearchRank(RecordList &records);

/// Sort by @p order; ties are broken by id ascending in both directions.
void orderBy(RecordList &records, SortOrder order);

/// Most recently accessed first, ties by id descending.
void orderByRecency(RecordList &records);

RecordList search(const RecordList &records, const std::string &text);
RecordList sortBy(const RecordList &records, SortField field,
                  SortDirection direction);
RecordList filter(const RecordList &records, const EmailFilter &filter);
RecordList run(const RecordList &records, const HistoryQuery &q);

} // namespace query

} // namespace mailcas

#endif // MAILCAS_HISTORY_QUERY_HPP
