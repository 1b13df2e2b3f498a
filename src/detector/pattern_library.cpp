#include "detector/pattern_library.hpp"

namespace promptguard {

namespace {

constexpr auto kExact = std::regex::ECMAScript | std::regex::optimize;
constexpr auto kNoCase = std::regex::ECMAScript | std::regex::optimize | std::regex::icase;

} // anonymous namespace

const PatternLibrary& PatternLibrary::instance() {
    static const PatternLibrary library;
    return library;
}

const std::vector<std::string_view>& PatternLibrary::bulk_indicators() {
    static const std::vector<std::string_view> indicators = {
        "list of", "all clients", "all customers", "full list"
    };
    return indicators;
}

PatternLibrary::PatternLibrary() {
    // ---- Structured PII ----------------------------------------------------
    pii_.push_back({Category::EMAIL, std::regex(
        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", kExact)});
    pii_.push_back({Category::PHONE, std::regex(
        R"(\b(\+?\d{1,3}[-.\s]?)?\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4}\b)", kExact)});
    pii_.push_back({Category::SSN, std::regex(
        R"(\b\d{3}-?\d{2}-?\d{4}\b)", kExact)});
    pii_.push_back({Category::CREDIT_CARD, std::regex(
        R"(\b(?:\d{4}[-\s]?){3}\d{4}\b|\b\d{16}\b)", kExact)});
    pii_.push_back({Category::ID_NUMBER, std::regex(
        R"(\b\d{9}\b)", kExact)});
    pii_.push_back({Category::IBAN, std::regex(
        R"(\b[A-Z]{2}\d{2}[A-Z0-9]{4}\d{7}[A-Z0-9]{0,16}\b)", kExact)});
    pii_.push_back({Category::ADDRESS, std::regex(
        R"(\b\d+\s+[A-Za-z]+\s+(Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Parkway|Pkwy|Place|Pl|Square|Sq|Trail|Trl|Circle|Cir)\b)",
        kNoCase)});
    pii_.push_back({Category::PASSPORT, std::regex(
        R"(\b[A-Z]{1,2}\d{6,9}\b)", kExact)});
    pii_.push_back({Category::DRIVERS_LICENSE, std::regex(
        R"(\b[A-Z]{1,2}\d{5,8}\b)", kExact)});
    pii_.push_back({Category::MEDICAL_ID, std::regex(
        R"(\b(MRN|Medical Record|Patient ID)[\s:#-]*\d{6,10}\b)", kNoCase)});
    pii_.push_back({Category::TAX_ID, std::regex(
        R"(\b\d{2}-?\d{7}\b)", kExact)});
    pii_.push_back({Category::VAT_NUMBER, std::regex(
        R"(\b(VAT|Tax ID)[\s:#-]*[A-Z]{2}\d{8,12}\b)", kNoCase)});

    // ---- Secret material ---------------------------------------------------
    pii_.push_back({Category::API_KEY_OPENAI, std::regex(
        R"(\bsk-[A-Za-z0-9]{48}\b)", kExact)});
    pii_.push_back({Category::API_KEY_AWS, std::regex(
        R"(\b(AKIA|ASIA)[A-Z0-9]{16}\b)", kExact)});
    pii_.push_back({Category::API_KEY_GENERIC, std::regex(
        R"(\b(api[_-]?key|apikey|api[_-]?secret)[\s:=]+['"]?[A-Za-z0-9_-]{20,}['"]?\b)", kNoCase)});
    pii_.push_back({Category::SECRET_KEY, std::regex(
        R"(\b(secret[_-]?key|private[_-]?key|access[_-]?token)[\s:=]+['"]?[A-Za-z0-9_-]{20,}['"]?\b)", kNoCase)});

    // ---- Sensitive keywords ------------------------------------------------
    pii_.push_back({Category::KEYWORDS, std::regex(
        R"(\b(client name|customer name|salary list|client list|customer list|employee list|confidential|proprietary)\b)",
        kNoCase)});

    // ---- SQL syntax (line scoped: '.' never crosses a newline) -------------
    sql_.push_back({"union_select",     std::regex(R"(\bUNION\b.*\bSELECT\b)", kNoCase), true});
    sql_.push_back({"drop_table",       std::regex(R"(\bDROP\b.*\bTABLE\b)", kNoCase), true});
    sql_.push_back({"insert_values",    std::regex(R"(\bINSERT\b.*\bINTO\b.*\bVALUES\b)", kNoCase), true});
    sql_.push_back({"delete_from",      std::regex(R"(\bDELETE\b.*\bFROM\b)", kNoCase), true});
    sql_.push_back({"update_set",       std::regex(R"(\bUPDATE\b.*\bSET\b)", kNoCase), true});
    sql_.push_back({"stacked_drop",     std::regex(R"(;.*\bDROP\b)", kNoCase), true});
    sql_.push_back({"quoted_tautology", std::regex(R"('.*OR.*'.*=.*')", kNoCase), true});
    sql_.push_back({"sql_comment",      std::regex(R"(--|#|/\*.*\*/)", kExact), true});
    sql_.push_back({"exec_call",        std::regex(R"(\bEXEC\b|\bEXECUTE\b)", kNoCase), true});
    sql_.push_back({"xp_cmdshell",      std::regex(R"(\bxp_cmdshell\b)", kNoCase), true});

    // ---- Script / XSS payloads ---------------------------------------------
    xss_.push_back({"script_tag",     std::regex(R"(<script\b[^>]*>[\s\S]*?</script>)", kNoCase), false});
    xss_.push_back({"iframe_tag",     std::regex(R"(<iframe\b[^>]*>)", kNoCase), false});
    xss_.push_back({"javascript_uri", std::regex(R"(javascript:)", kNoCase), true});
    xss_.push_back({"event_handler",  std::regex(R"(on(load|error|click|mouse\w+|focus|blur)\s*=)", kNoCase), false});
    xss_.push_back({"img_javascript", std::regex(R"(<img[^>]+src\s*=\s*["']?javascript:)", kNoCase), false});
    xss_.push_back({"object_tag",     std::regex(R"(<object\b[^>]*>)", kNoCase), false});
    xss_.push_back({"embed_tag",      std::regex(R"(<embed\b[^>]*>)", kNoCase), false});
    xss_.push_back({"eval_call",      std::regex(R"(eval\s*\()", kNoCase), false});
    xss_.push_back({"css_expression", std::regex(R"(expression\s*\()", kNoCase), false});
    xss_.push_back({"vbscript_uri",   std::regex(R"(vbscript:)", kNoCase), true});

    // ---- Prompt jailbreak phrasing -----------------------------------------
    // instruction override
    jailbreak_.push_back({"instruction_override", std::regex(
        R"(ignore\s+(all\s+)?(previous|prior|above)\s+instructions?)", kNoCase), false});
    jailbreak_.push_back({"instruction_override", std::regex(
        R"(disregard\s+(all\s+)?(previous|prior|above)\s+(instructions?|rules?))", kNoCase), false});
    jailbreak_.push_back({"instruction_override", std::regex(
        R"(forget\s+(all\s+)?(previous|prior|above)\s+instructions?)", kNoCase), false});
    // safety bypass
    jailbreak_.push_back({"safety_bypass", std::regex(
        R"(bypass\s+(safety|security|filter|protection))", kNoCase), false});
    jailbreak_.push_back({"safety_bypass", std::regex(
        R"(disable\s+(safety|security|filter|protection))", kNoCase), false});
    jailbreak_.push_back({"safety_bypass", std::regex(
        R"(override\s+(safety|security|filter|protection))", kNoCase), false});
    // role hijack
    jailbreak_.push_back({"role_hijack", std::regex(
        R"(you\s+are\s+now\s+(a|an)\s+\w+)", kNoCase), false});
    jailbreak_.push_back({"role_hijack", std::regex(
        R"(act\s+as\s+(if|though)\s+you\s+(are|were))", kNoCase), false});
    jailbreak_.push_back({"role_hijack", std::regex(
        R"(pretend\s+(you\s+are|to\s+be))", kNoCase), false});
    // system prompt extraction
    jailbreak_.push_back({"prompt_extraction", std::regex(
        R"(reveal\s+(your\s+)?(system\s+)?(prompt|instructions?))", kNoCase), false});
    jailbreak_.push_back({"prompt_extraction", std::regex(
        R"(show\s+(me\s+)?(your\s+)?(system\s+)?(prompt|instructions?))", kNoCase), false});
    jailbreak_.push_back({"prompt_extraction", std::regex(
        R"(what\s+(are|is)\s+your\s+(system\s+)?(prompt|instructions?))", kNoCase), false});
    // bulk exfiltration
    jailbreak_.push_back({"bulk_exfiltration", std::regex(
        R"(print\s+all\s+(clients?|customers?|users?|data))", kNoCase), false});
    jailbreak_.push_back({"bulk_exfiltration", std::regex(
        R"(show\s+all\s+(clients?|customers?|users?|data))", kNoCase), false});
    jailbreak_.push_back({"bulk_exfiltration", std::regex(
        R"(list\s+all\s+(clients?|customers?|users?|data))", kNoCase), false});
    jailbreak_.push_back({"bulk_exfiltration", std::regex(
        R"(reveal\s+(all\s+)?(hidden|secret|private)\s+data)", kNoCase), false});
    jailbreak_.push_back({"bulk_exfiltration", std::regex(
        R"(export\s+all\s+data)", kNoCase), false});
    // DAN / developer mode
    jailbreak_.push_back({"dan_mode", std::regex(R"(\bDAN\s+mode\b)", kNoCase), false});
    jailbreak_.push_back({"dan_mode", std::regex(R"(do\s+anything\s+now)", kNoCase), false});
    jailbreak_.push_back({"dan_mode", std::regex(R"(developer\s+mode)", kNoCase), false});
    // privileged tag markers
    jailbreak_.push_back({"privileged_tag", std::regex(R"(\[SYSTEM\])", kNoCase), true});
    jailbreak_.push_back({"privileged_tag", std::regex(R"(\[ADMIN\])", kNoCase), true});
    jailbreak_.push_back({"privileged_tag", std::regex(R"(\[ROOT\])", kNoCase), true});
    jailbreak_.push_back({"privileged_tag", std::regex(R"(sudo\s+)", kNoCase), false});
}

} // namespace promptguard
