#include "PatternRecognizer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <tuple>

namespace pii {

const double PatternRecognizer::CONTEXT_BOOST = 0.35;
const double PatternRecognizer::MIN_BOOSTED_SCORE = 0.4;

namespace {

std::vector<std::string> lowerWords(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (char c : text) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte)) {
      current += static_cast<char>(std::tolower(byte));
    } else if (!current.empty()) {
      words.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

std::string digitsOf(const std::string &text) {
  std::string digits;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits += c;
    }
  }
  return digits;
}

PatternRule rule(const std::string &name, const std::string &expression,
                 double score, int group = 0) {
  return PatternRule{name, std::regex(expression), score, group};
}

} // anonymous namespace

PatternRecognizer::PatternRecognizer() : PatternRecognizer(RecognizerOptions()) {}

PatternRecognizer::PatternRecognizer(const RecognizerOptions &options)
    : m_options(options), m_recognizers(defaultRecognizers()) {
  if (m_options.includeAustralian) {
    for (auto &recognizer : australianRecognizers()) {
      m_recognizers.push_back(std::move(recognizer));
    }
  }
}

void PatternRecognizer::addRecognizer(Recognizer recognizer) {
  m_recognizers.push_back(std::move(recognizer));
}

std::vector<std::string> PatternRecognizer::supportedEntities() const {
  std::set<std::string> types;
  for (const auto &recognizer : m_recognizers) {
    types.insert(recognizer.entityType);
  }
  return std::vector<std::string>(types.begin(), types.end());
}

bool PatternRecognizer::luhnValid(const std::string &text) {
  const std::string digits = digitsOf(text);
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }

  int sum = 0;
  bool doubleIt = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int d = *it - '0';
    if (doubleIt) {
      d *= 2;
      if (d > 9) {
        d -= 9;
      }
    }
    sum += d;
    doubleIt = !doubleIt;
  }
  return sum % 10 == 0;
}

bool PatternRecognizer::abnValid(const std::string &text) {
  static const int weights[11] = {10, 1, 3, 5, 7, 9, 11, 13, 15, 17, 19};

  const std::string digits = digitsOf(text);
  if (digits.size() != 11) {
    return false;
  }

  int total = 0;
  for (size_t i = 0; i < digits.size(); i++) {
    int d = digits[i] - '0';
    if (i == 0) {
      d -= 1;
    }
    total += d * weights[i];
  }
  return total % 89 == 0;
}

bool PatternRecognizer::hasContext(const std::string &text, int start,
                                   const std::vector<std::string> &context,
                                   int windowWords) {
  if (context.empty() || start <= 0 || windowWords <= 0) {
    return false;
  }

  std::vector<std::string> words =
      lowerWords(text.substr(0, static_cast<size_t>(start)));
  if (static_cast<int>(words.size()) > windowWords) {
    words.erase(words.begin(), words.end() - windowWords);
  }

  for (const auto &phrase : context) {
    const std::vector<std::string> phraseWords = lowerWords(phrase);
    if (phraseWords.empty() || phraseWords.size() > words.size()) {
      continue;
    }
    if (std::search(words.begin(), words.end(), phraseWords.begin(),
                    phraseWords.end()) != words.end()) {
      return true;
    }
  }
  return false;
}

Recognizer
PatternRecognizer::denyListRecognizer(const std::string &entityType,
                                      const std::vector<std::string> &words) {
  // Longest alternatives first so "South Australia" wins over "SA"
  std::vector<std::string> sorted = words;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const std::string &a, const std::string &b) {
                     return a.size() > b.size();
                   });

  std::string alternation;
  for (const auto &word : sorted) {
    if (!alternation.empty()) {
      alternation += "|";
    }
    alternation += word;
  }

  Recognizer recognizer;
  recognizer.entityType = entityType;
  recognizer.patterns.push_back(
      rule("deny_list", "\\b(?:" + alternation + ")\\b", 1.0));
  return recognizer;
}

std::vector<Recognizer> PatternRecognizer::defaultRecognizers() {
  std::vector<Recognizer> recognizers;

  Recognizer email;
  email.entityType = "EMAIL_ADDRESS";
  email.patterns.push_back(
      rule("email", "\\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}\\b",
           1.0));
  recognizers.push_back(std::move(email));

  Recognizer phone;
  phone.entityType = "PHONE_NUMBER";
  phone.patterns.push_back(
      rule("phone_nanp",
           "(?:\\+\\d{1,3}[ .-]?)?(?:\\(\\d{3}\\)|\\b\\d{3})[ .-]?\\d{3}[ .-]?"
           "\\d{4}\\b",
           0.4));
  phone.patterns.push_back(
      rule("phone_intl", "\\+\\d{1,3}(?:[ .-]?\\d{2,4}){2,4}\\b", 0.4));
  phone.context = {"phone", "telephone", "cell", "mobile", "call", "tel", "fax"};
  recognizers.push_back(std::move(phone));

  Recognizer card;
  card.entityType = "CREDIT_CARD";
  card.patterns.push_back(rule("credit_card", "\\b(?:\\d[ -]?){12,18}\\d\\b", 0.3));
  card.context = {"credit", "card", "visa", "mastercard", "amex", "cc"};
  card.validator = &PatternRecognizer::luhnValid;
  recognizers.push_back(std::move(card));

  Recognizer ip;
  ip.entityType = "IP_ADDRESS";
  ip.patterns.push_back(
      rule("ipv4",
           "\\b(?:(?:25[0-5]|2[0-4]\\d|1\\d\\d|[1-9]?\\d)\\.){3}"
           "(?:25[0-5]|2[0-4]\\d|1\\d\\d|[1-9]?\\d)\\b",
           0.6));
  ip.context = {"ip", "address", "host", "server"};
  recognizers.push_back(std::move(ip));

  Recognizer url;
  url.entityType = "URL";
  url.patterns.push_back(
      rule("url", "\\b(?:https?://|www\\.)[^\\s<>\"']*[^\\s<>\"'.,;:!?)]", 0.6));
  url.context = {"url", "website", "link", "site"};
  recognizers.push_back(std::move(url));

  // Names are title-cased words after a title, a greeting or a label
  const std::string name =
      "((?:[A-Z]\\.[ \\t]*)*[A-Z][a-z]+(?:[-'][A-Z][a-z]+)?"
      "(?:[ \\t]+(?:[A-Z]\\.[ \\t]*)*[A-Z][a-z]+(?:[-'][A-Z][a-z]+)?)*)";

  Recognizer person;
  person.entityType = "PERSON";
  person.patterns.push_back(
      rule("person_with_title",
           "\\b(?:Mr|Mrs|Ms|Mx|Miss|Dr|Prof|Professor|Sir|Madam)\\.?[ \\t]+" +
               name,
           0.85, 1));
  person.patterns.push_back(
      rule("person_after_greeting",
           "\\b(?:Hello|Hi|Dear|Good (?:[Mm]orning|[Aa]fternoon|[Ee]vening))"
           "[,!]?[ \\t]+(?:(?:Mr|Mrs|Ms|Mx|Miss|Dr|Prof)\\.?[ \\t]+)?" +
               name,
           0.75, 1));
  person.patterns.push_back(
      rule("person_labelled",
           "\\b(?:[Nn]ame|[Ff]ull [Nn]ame|[Cc]ustomer|[Pp]atient|[Cc]lient|"
           "[Aa]pplicant|[Ee]mployee|[Ss]tudent)[ \\t]*:[ \\t]*" +
               name,
           0.7, 1));
  recognizers.push_back(std::move(person));

  return recognizers;
}

std::vector<Recognizer> PatternRecognizer::australianRecognizers() {
  std::vector<Recognizer> recognizers;

  Recognizer tfn;
  tfn.entityType = "AU_TFN";
  tfn.patterns.push_back(rule("tfn_spaced", "\\b\\d{3}\\s?\\d{3}\\s?\\d{3}\\b", 0.5));
  tfn.patterns.push_back(rule("tfn_dashed", "\\b\\d{3}-\\d{3}-\\d{3}\\b", 0.6));
  tfn.patterns.push_back(rule("tfn_plain", "\\b\\d{9}\\b", 0.4));
  tfn.context = {"tfn", "tax file number", "tax file no", "tax file"};
  recognizers.push_back(std::move(tfn));

  Recognizer medicare;
  medicare.entityType = "AU_MEDICARE";
  medicare.patterns.push_back(
      rule("medicare_spaced", "\\b\\d{4}\\s?\\d{5}\\s?\\d{1}\\b", 0.6));
  medicare.patterns.push_back(
      rule("medicare_plain", "\\b\\d{10}\\s?\\d{1}\\b", 0.55));
  medicare.context = {"medicare", "medicare number", "medicare card",
                      "medicare no"};
  recognizers.push_back(std::move(medicare));

  Recognizer crn;
  crn.entityType = "AU_CENTRELINK_CRN";
  crn.patterns.push_back(rule("crn_10_digit", "\\b\\d{10}\\b", 0.4));
  crn.patterns.push_back(rule("crn_9_digit", "\\b\\d{9}\\b", 0.35));
  crn.patterns.push_back(
      rule("crn_spaced", "\\b\\d{3}\\s?\\d{3}\\s?\\d{3,4}\\b", 0.45));
  crn.context = {"crn", "customer reference number", "centrelink",
                 "centrelink number", "reference number"};
  recognizers.push_back(std::move(crn));

  Recognizer passport;
  passport.entityType = "AU_PASSPORT";
  passport.patterns.push_back(
      rule("passport_new_format", "\\b[A-Z]{1,2}\\d{7}\\b", 0.6));
  passport.patterns.push_back(
      rule("passport_spaced", "\\b[A-Z]{1,2}\\s?\\d{7}\\b", 0.55));
  passport.context = {"passport", "passport number", "passport no",
                      "australian passport", "travel document"};
  recognizers.push_back(std::move(passport));

  Recognizer abn;
  abn.entityType = "AU_ABN";
  abn.patterns.push_back(rule("abn_spaced", "\\b(?:\\d ?){10}\\d\\b", 0.5));
  abn.patterns.push_back(
      rule("abn_grouped", "\\b\\d{2}\\s?\\d{3}\\s?\\d{3}\\s?\\d{3}\\b", 0.6));
  abn.patterns.push_back(rule("abn_plain", "\\b\\d{11}\\b", 0.45));
  abn.context = {"abn", "australian business number", "business number",
                 "abn number"};
  abn.validator = &PatternRecognizer::abnValid;
  recognizers.push_back(std::move(abn));

  Recognizer acn;
  acn.entityType = "AU_ACN";
  acn.patterns.push_back(rule("acn_spaced", "\\b\\d{3}\\s?\\d{3}\\s?\\d{3}\\b", 0.5));
  acn.patterns.push_back(rule("acn_plain", "\\b\\d{9}\\b", 0.4));
  acn.context = {"acn", "australian company number", "company number",
                 "acn number"};
  recognizers.push_back(std::move(acn));

  Recognizer bsb;
  bsb.entityType = "AU_BSB";
  bsb.patterns.push_back(rule("bsb_dashed", "\\b\\d{3}-\\d{3}\\b", 0.7));
  bsb.patterns.push_back(rule("bsb_spaced", "\\b\\d{3} \\d{3}\\b", 0.65));
  bsb.patterns.push_back(rule("bsb_plain", "\\b\\d{6}\\b", 0.4));
  bsb.context = {"bsb", "bank state branch", "branch code", "bsb code"};
  recognizers.push_back(std::move(bsb));

  // State formats: NSW 8 digits, VIC 10, QLD 8-9, SA 6 digits and a letter,
  // WA 7
  Recognizer licence;
  licence.entityType = "AU_DRIVER_LICENSE";
  licence.patterns.push_back(rule("driver_license_nsw", "\\b\\d{8}\\b", 0.4));
  licence.patterns.push_back(rule("driver_license_vic", "\\b\\d{10}\\b", 0.4));
  licence.patterns.push_back(rule("driver_license_qld", "\\b\\d{8,9}\\b", 0.35));
  licence.patterns.push_back(
      rule("driver_license_sa_alpha", "\\b\\d{6}[A-Z]\\b", 0.5));
  licence.patterns.push_back(rule("driver_license_wa", "\\b\\d{7}\\b", 0.4));
  licence.patterns.push_back(
      rule("driver_license_general", "\\b[A-Z0-9]{6,10}\\b", 0.3));
  licence.context = {"driver license",  "driver licence", "drivers license",
                     "driving licence", "dl number",      "license number",
                     "licence number",  "dl no"};
  recognizers.push_back(std::move(licence));

  Recognizer phone;
  phone.entityType = "AU_PHONE_NUMBER";
  phone.patterns.push_back(
      rule("phone_mobile_intl", "\\+61\\s?4\\d{2}\\s?\\d{3}\\s?\\d{3}\\b", 0.7));
  phone.patterns.push_back(
      rule("phone_mobile_domestic", "\\b04\\d{2}\\s?\\d{3}\\s?\\d{3}\\b", 0.65));
  phone.patterns.push_back(
      rule("phone_landline_brackets", "\\(0[2-8]\\)\\s?\\d{4}\\s?\\d{4}\\b", 0.6));
  phone.patterns.push_back(
      rule("phone_landline_intl", "\\+61\\s?[2-8]\\s?\\d{4}\\s?\\d{4}\\b", 0.7));
  phone.patterns.push_back(
      rule("phone_tollfree", "\\b1[38]00\\s?\\d{3}\\s?\\d{3}\\b", 0.6));
  phone.context = {"phone", "telephone", "mobile", "contact", "call", "tel",
                   "ph"};
  recognizers.push_back(std::move(phone));

  Recognizer account;
  account.entityType = "AU_BANK_ACCOUNT";
  account.patterns.push_back(
      rule("bank_account_typical", "\\b\\d{6}[- ]?\\d{6,10}\\b", 0.45));
  account.patterns.push_back(rule("bank_account_long", "\\b\\d{8,12}\\b", 0.3));
  account.patterns.push_back(rule("bank_account_short", "\\b\\d{6,7}\\b", 0.25));
  account.context = {"bank account", "account number", "acct no", "account no",
                     "acc no", "bsb", "account"};
  recognizers.push_back(std::move(account));

  recognizers.push_back(denyListRecognizer(
      "AU_STATE",
      {"NSW", "VIC", "QLD", "SA", "WA", "TAS", "ACT", "NT", "New South Wales",
       "Victoria", "Queensland", "South Australia", "Western Australia",
       "Tasmania", "Australian Capital Territory", "Northern Territory"}));

  Recognizer postcode;
  postcode.entityType = "AU_POSTCODE";
  postcode.patterns.push_back(rule("postcode_4digit", "\\b\\d{4}\\b", 0.35));
  postcode.context = {"postcode", "postal code", "post code",
                      "delivery address", "suburb", "address", "post"};
  recognizers.push_back(std::move(postcode));

  return recognizers;
}

std::vector<DetectionSpan>
PatternRecognizer::analyze(const std::string &text, const std::string &language,
                           const std::vector<std::string> &entityTypes) const {
  std::vector<DetectionSpan> spans;
  if (language != "en" || text.empty()) {
    return spans;
  }

  // (start, end, type) -> best score
  std::map<std::tuple<int, int, std::string>, double> best;

  for (const auto &recognizer : m_recognizers) {
    if (!entityTypes.empty() &&
        std::find(entityTypes.begin(), entityTypes.end(),
                  recognizer.entityType) == entityTypes.end()) {
      continue;
    }

    for (const auto &pattern : recognizer.patterns) {
      auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
      for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch &match = *it;
        if (!match[pattern.group].matched || match.length(pattern.group) == 0) {
          continue;
        }

        const int start = static_cast<int>(match.position(pattern.group));
        const int end = start + static_cast<int>(match.length(pattern.group));
        double score = pattern.score;

        if (recognizer.validator) {
          if (!recognizer.validator(match.str(pattern.group))) {
            continue;
          }
          score = 1.0;
        } else if (hasContext(text, start, recognizer.context,
                              m_options.contextWindowWords)) {
          score = std::min(1.0,
                           std::max(score + CONTEXT_BOOST, MIN_BOOSTED_SCORE));
        }

        auto key = std::make_tuple(start, end, recognizer.entityType);
        auto found = best.find(key);
        if (found == best.end() || score > found->second) {
          best[key] = score;
        }
      }
    }
  }

  spans.reserve(best.size());
  for (const auto &entry : best) {
    DetectionSpan span;
    span.start = std::get<0>(entry.first);
    span.end = std::get<1>(entry.first);
    span.entityType = std::get<2>(entry.first);
    span.score = entry.second;
    spans.push_back(std::move(span));
  }
  return spans;
}

} // namespace pii
