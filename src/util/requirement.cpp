#include <pep2rpm/requirement.hpp>
#include <pep2rpm/log.hpp>
#include <atomic>
#include <cctype>
#include <sstream>
#include <thread>

namespace pep2rpm {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

// ---------------------------------------------------------------------------
// Requirement
// ---------------------------------------------------------------------------

Result<Requirement> Requirement::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return Pep2RpmError{Pep2RpmError::Parse, "empty requirement"};
    }

    Requirement req;
    size_t pos = 0;
    while (pos < text.size() && is_name_char(text[pos])) ++pos;
    if (pos == 0) {
        return Pep2RpmError{Pep2RpmError::Parse,
            "requirement '" + text + "' does not start with a package name"};
    }
    auto name = PkgName::parse(text.substr(0, pos));
    if (name.is_err()) {
        Pep2RpmError err = std::move(name).error();
        err.code = Pep2RpmError::Parse;
        return err;
    }
    req.name = std::move(name).value();

    auto skip_ws = [&] {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    };

    skip_ws();
    if (pos < text.size() && text[pos] == '[') {
        size_t close = text.find(']', pos);
        if (close == std::string::npos) {
            return Pep2RpmError{Pep2RpmError::Parse,
                "unclosed '[' in requirement '" + text + "'"};
        }
        std::istringstream stream(text.substr(pos + 1, close - pos - 1));
        std::string extra;
        while (std::getline(stream, extra, ',')) {
            extra = trim(extra);
            if (extra.empty()) continue;
            if (!is_valid_name(extra)) {
                return Pep2RpmError{Pep2RpmError::Parse,
                    "invalid extra name '" + extra + "' in requirement '" + text + "'"};
            }
            req.extras.push_back(extra);
        }
        pos = close + 1;
        skip_ws();
    }

    std::string marker_text;
    bool has_marker = false;

    if (pos < text.size() && text[pos] == '@') {
        ++pos;
        skip_ws();
        size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        req.url = text.substr(start, pos - start);
        if (req.url.empty()) {
            return Pep2RpmError{Pep2RpmError::Parse,
                "missing URL after '@' in requirement '" + text + "'"};
        }
        skip_ws();
        if (pos < text.size()) {
            if (text[pos] != ';') {
                return Pep2RpmError{Pep2RpmError::Parse,
                    "expected ';' after URL in requirement '" + text + "'"};
            }
            has_marker = true;
            marker_text = text.substr(pos + 1);
        }
    } else {
        size_t semi = text.find(';', pos);
        std::string spec_text = trim(text.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos));
        if (semi != std::string::npos) {
            has_marker = true;
            marker_text = text.substr(semi + 1);
        }

        if (!spec_text.empty() && spec_text.front() == '(') {
            if (spec_text.back() != ')') {
                return Pep2RpmError{Pep2RpmError::Parse,
                    "unclosed '(' in requirement '" + text + "'"};
            }
            spec_text = spec_text.substr(1, spec_text.size() - 2);
        }
        auto specs = SpecifierSet::parse(spec_text);
        if (specs.is_err()) return std::move(specs).error();
        req.specifiers = std::move(specs).value();
    }

    if (has_marker) {
        auto marker = MarkerExpr::parse(marker_text);
        if (marker.is_err()) return std::move(marker).error();
        req.marker = std::move(marker).value();
    }

    return Result<Requirement>::ok(std::move(req));
}

std::string Requirement::to_string() const {
    std::string s = name.raw();
    if (!extras.empty()) {
        s += "[";
        for (size_t i = 0; i < extras.size(); ++i) {
            if (i > 0) s += ",";
            s += extras[i];
        }
        s += "]";
    }
    if (!url.empty()) {
        s += " @ " + url;
    } else {
        s += specifiers.to_string();
    }
    if (marker) {
        s += (url.empty() ? "; " : " ; ") + marker->to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// RequirementConverter
// ---------------------------------------------------------------------------

RequirementConverter::RequirementConverter(NameTemplate package_template,
                                           Environment environment,
                                           DynamicVariableMap dynamic,
                                           SpecifierTranslator translator)
    : package_template_(std::move(package_template)),
      environment_(std::move(environment)),
      dynamic_(std::move(dynamic)),
      translator_(translator) {}

Result<RequirementConverter> RequirementConverter::from_config(const Config& cfg) {
    auto tmpl = NameTemplate::parse(cfg.package_template_text());
    if (tmpl.is_err()) return std::move(tmpl).error();

    SpecifierTranslator translator(cfg.version_style.value_or(VersionStyle::Literal),
                                   cfg.local_policy());
    return Result<RequirementConverter>::ok(RequirementConverter(
        std::move(tmpl).value(), cfg.environment, cfg.dynamic, translator));
}

Result<TranslationResult> RequirementConverter::evaluate(const MarkerExpr& marker,
                                                         const ExtraSet& extras) const {
    return evaluate_marker(marker, environment_, extras, dynamic_);
}

Result<std::optional<std::string>> RequirementConverter::convert_one(
    const Requirement& req, const ExtraSet& extras) const
{
    using Out = Result<std::optional<std::string>>;

    TranslationResult condition = TranslationResult::constant(true);
    if (req.marker) {
        auto evaluated = evaluate(*req.marker, extras);
        if (evaluated.is_err()) return std::move(evaluated).error();
        condition = std::move(evaluated).value();
    }

    if (condition.is_false()) {
        log::debug("dropping '%s': marker is false", req.to_string().c_str());
        return Out::ok(std::nullopt);
    }

    if (!req.url.empty()) {
        log::warn("'%s' is a URL requirement, depending on %s without a version",
                  req.to_string().c_str(), req.name.raw().c_str());
    }

    std::string capability = package_template_.format(req.name.raw());
    auto clauses = translator_.translate(capability, req.specifiers);
    if (clauses.is_err()) return std::move(clauses).error();

    std::string text = clauses.value().empty() ? capability : join_clauses(clauses.value());
    if (condition.is_true()) {
        return Out::ok(std::move(text));
    }

    log::trace("'%s' deferred to install time: %s",
               req.to_string().c_str(), condition.text().c_str());
    return Out::ok("(" + text + " " + condition.text() + ")");
}

Result<std::optional<std::string>> RequirementConverter::convert_one(
    const std::string& req, const ExtraSet& extras) const
{
    auto parsed = Requirement::parse(req);
    if (parsed.is_err()) return std::move(parsed).error();
    return convert_one(parsed.value(), extras);
}

Result<std::vector<std::string>> RequirementConverter::convert(
    const std::vector<std::string>& reqs, const ExtraSet& extras) const
{
    std::vector<std::string> out;
    for (const auto& req : reqs) {
        auto converted = convert_one(req, extras);
        if (converted.is_err()) return std::move(converted).error();
        if (converted.value()) {
            out.push_back(std::move(*converted.value()));
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

std::vector<Result<std::optional<std::string>>> RequirementConverter::convert_each(
    const std::vector<std::string>& reqs, const ExtraSet& extras) const
{
    std::vector<Result<std::optional<std::string>>> out;
    out.reserve(reqs.size());
    for (const auto& req : reqs) {
        out.push_back(convert_one(req, extras));
    }
    return out;
}

Result<std::vector<std::string>> RequirementConverter::convert_parallel(
    const std::vector<std::string>& reqs, const ExtraSet& extras, unsigned workers) const
{
    if (workers == 0) workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    if (workers > reqs.size()) workers = static_cast<unsigned>(reqs.size());
    if (workers <= 1) return convert(reqs, extras);

    // Each worker claims the next index and writes only its own slot
    std::vector<std::optional<Result<std::optional<std::string>>>> slots(reqs.size());
    std::atomic<size_t> next{0};

    auto work = [&] {
        for (size_t i = next++; i < reqs.size(); i = next++) {
            slots[i] = convert_one(reqs[i], extras);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
        pool.emplace_back(work);
    }
    for (auto& t : pool) {
        t.join();
    }

    std::vector<std::string> out;
    for (auto& slot : slots) {
        if (slot->is_err()) return std::move(*slot).error();
        if (slot->value()) {
            out.push_back(std::move(*slot->value()));
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::string> RequirementConverter::constrain(const std::string& capability,
                                                    const std::string& specifiers) const {
    auto clauses = translator_.translate(capability, specifiers);
    if (clauses.is_err()) return std::move(clauses).error();
    return Result<std::string>::ok(join_clauses(clauses.value()));
}

} // namespace pep2rpm
