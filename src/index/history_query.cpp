#include "index/history_query.hpp"
#include "utilities/text_utils.hpp"

#include <algorithm>
#include <iterator>

namespace mailcas::query {

bool matchesSearch(const HistoryRecord &record, const std::string &text) {
  const std::string needle = text::trim(text);
  if (needle.empty())
    return true;
  return text::containsIgnoreCase(record.subject, needle) ||
         text::containsIgnoreCase(record.senderEmail, needle) ||
         text::containsIgnoreCase(record.senderName, needle) ||
         text::containsIgnoreCase(record.recipientEmails, needle) ||
         text::containsIgnoreCase(record.recipientNames, needle) ||
         text::containsIgnoreCase(record.bodyPreview, needle);
}

bool matchesFilter(const HistoryRecord &record, const EmailFilter &f) {
  if (f.hasAttachments && record.hasAttachments != *f.hasAttachments)
    return false;
  const int64_t date = record.effectiveDate();
  if (f.dateFrom && date < *f.dateFrom)
    return false;
  if (f.dateTo && date > *f.dateTo)
    return false;
  if (f.senderContains &&
      !text::containsIgnoreCase(record.senderEmail, *f.senderContains) &&
      !text::containsIgnoreCase(record.senderName, *f.senderContains))
    return false;
  return true;
}

void orderBySearchRank(RecordList &records) {
  std::sort(records.begin(), records.end(),
            [](const HistoryRecord &a, const HistoryRecord &b) {
              if (a.effectiveDate() != b.effectiveDate())
                return a.effectiveDate() > b.effectiveDate();
              return a.id > b.id;
            });
}

void orderBy(RecordList &records, SortOrder order) {
  const bool descending = order.direction == SortDirection::DESCENDING;
  std::sort(records.begin(), records.end(),
            [&](const HistoryRecord &a, const HistoryRecord &b) {
              int cmp = 0;
              switch (order.field) {
              case SortField::DATE:
                cmp = a.effectiveDate() < b.effectiveDate()
                          ? -1
                          : (a.effectiveDate() > b.effectiveDate() ? 1 : 0);
                break;
              case SortField::SUBJECT:
                cmp = text::compareIgnoreCase(a.subject, b.subject);
                break;
              case SortField::SENDER:
                cmp = text::compareIgnoreCase(a.displaySender(),
                                              b.displaySender());
                break;
              }
              if (cmp != 0)
                return descending ? cmp > 0 : cmp < 0;
              return a.id < b.id;
            });
}

void orderByRecency(RecordList &records) {
  std::sort(records.begin(), records.end(),
            [](const HistoryRecord &a, const HistoryRecord &b) {
              if (a.lastAccessed != b.lastAccessed)
                return a.lastAccessed > b.lastAccessed;
              return a.id > b.id;
            });
}

RecordList search(const RecordList &records, const std::string &text) {
  RecordList out;
  std::copy_if(records.begin(), records.end(), std::back_inserter(out),
               [&](const HistoryRecord &r) { return matchesSearch(r, text); });
  orderBySearchRank(out);
  return out;
}

RecordList sortBy(const RecordList &records, SortField field,
                  SortDirection direction) {
  RecordList out(records);
  orderBy(out, SortOrder{field, direction});
  return out;
}

RecordList filter(const RecordList &records, const EmailFilter &f) {
  RecordList out;
  std::copy_if(records.begin(), records.end(), std::back_inserter(out),
               [&](const HistoryRecord &r) { return matchesFilter(r, f); });
  orderBySearchRank(out);
  return out;
}

RecordList run(const RecordList &records, const HistoryQuery &q) {
  RecordList out;
  std::copy_if(records.begin(), records.end(), std::back_inserter(out),
               [&](const HistoryRecord &r) {
                 return matchesSearch(r, q.text) && matchesFilter(r, q.filter);
               });
  if (q.sort)
    orderBy(out, *q.sort);
  else
    orderBySearchRank(out);
  return out;
}

} // namespace mailcas::query
