#include "babylonify/detector.h"

#include "babylonify/utf8.h"

#include <climits>
#include <string>

namespace babylonify {

Result<Language> Cld2Detector::detect(std::string_view text) const {
  if (text.size() > static_cast<size_t>(INT_MAX)) {
    return Result<Language>::failure(ErrorCode::DETECTION_ERROR,
                                     "Text value too large for detection (" +
                                         std::to_string(text.size()) + " bytes)");
  }

  // Short transcripts never reach CLD2's reliability cut; best effort
  // reports the top-scoring language instead of UNKNOWN
  Language language3[3] = {kUndetermined, kUndetermined, kUndetermined};
  int percent3[3] = {};
  double normalized_score3[3] = {};
  int text_bytes = 0;
  bool is_reliable = false;
  int valid_prefix_bytes = 0;
  int len = static_cast<int>(text.size());
  Language lang = CLD2::ExtDetectLanguageSummaryCheckUTF8(
      text.data(), len, /*is_plain_text=*/true, /*cld_hints=*/nullptr, CLD2::kCLDFlagBestEffort,
      language3, percent3, normalized_score3, /*resultchunkvector=*/nullptr, &text_bytes,
      &is_reliable, &valid_prefix_bytes);

  if (valid_prefix_bytes < len) {
    return Result<Language>::failure(
        ErrorCode::DETECTION_ERROR,
        "Invalid UTF-8 at byte " + std::to_string(valid_prefix_bytes) + " in '" +
            utf8_truncate(text.substr(0, static_cast<size_t>(valid_prefix_bytes)), 40) + "'");
  }

  return Result<Language>::success(lang);
}

} // namespace babylonify
