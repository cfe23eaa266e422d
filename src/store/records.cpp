#include "store/records.h"
#include "utilities/text_utils.hpp"

namespace mailcas {

void HistoryRecord::applyMetadata(const EmailMetadata &meta) {
  subject = meta.subject;
  senderEmail = meta.senderEmail;
  senderName = meta.senderName;
  recipientEmails = meta.recipientEmails;
  recipientNames = meta.recipientNames;
  // Negative dates are as meaningless as a missing Date header.
  emailDate = meta.emailDate > 0 ? meta.emailDate : 0;
  hasAttachments = meta.hasAttachments;
  bodyPreview = text::truncateUtf8(meta.bodyPreview, BODY_PREVIEW_MAX_CHARS);
}

} // namespace mailcas
