#include "io/XmlIO.hpp"

#include <expat.h>

#include <cctype>
#include <climits>
#include <exception>
#include <memory>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace xmlio {

namespace {

struct Frame {
    std::string name;
    json obj = json::object();
    std::string text;
};

struct ParseState {
    XML_Parser parser = nullptr;
    std::vector<Frame> stack;
    json root;
    // first exception raised inside a callback; rethrown once XML_Parse returns
    std::exception_ptr error;
};

constexpr size_t kMaxDepth = 256;

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

void start_element(ParseState& st, const XML_Char* name, const XML_Char** atts) {
    if (st.stack.size() >= kMaxDepth) {
        std::ostringstream oss;
        oss << "failed to parse XML: elements nested deeper than " << kMaxDepth
            << " (line " << XML_GetCurrentLineNumber(st.parser) << ")";
        throw XmlParseError(oss.str(),
                            static_cast<long>(XML_GetCurrentLineNumber(st.parser)),
                            static_cast<long>(XML_GetCurrentColumnNumber(st.parser)));
    }

    Frame f;
    f.name = name;
    if (atts && atts[0]) {
        json attrs = json::object();
        for (size_t i = 0; atts[i]; i += 2) attrs[atts[i]] = atts[i + 1];
        f.obj["$"] = std::move(attrs);
    }
    st.stack.push_back(std::move(f));
}

void end_element(ParseState& st) {
    Frame f = std::move(st.stack.back());
    st.stack.pop_back();

    const bool blank = is_blank(f.text);
    if (!blank) f.obj["_"] = f.text;

    json value;
    if (f.obj.empty()) {
        // only whitespace (or nothing) inside; kept verbatim
        value = f.text;
    } else if (f.obj.size() == 1 && f.obj.contains("_")) {
        value = f.obj["_"];
    } else {
        value = std::move(f.obj);
    }

    if (st.stack.empty()) {
        st.root = json::object();
        st.root[f.name] = std::move(value);
        return;
    }

    json& siblings = st.stack.back().obj[f.name];
    if (!siblings.is_array()) siblings = json::array();
    siblings.push_back(std::move(value));
}

// Exceptions must not unwind through Expat's C frames. Park the exception,
// stop the parser and let parse_xml rethrow it.
template <typename Fn>
void guarded(void* ud, Fn&& fn) {
    auto* st = static_cast<ParseState*>(ud);
    if (st->error) return;
    try {
        fn(*st);
    } catch (...) {
        st->error = std::current_exception();
        XML_StopParser(st->parser, XML_FALSE);
    }
}

void XMLCALL on_start(void* ud, const XML_Char* name, const XML_Char** atts) {
    guarded(ud, [&](ParseState& st) { start_element(st, name, atts); });
}

void XMLCALL on_chars(void* ud, const XML_Char* s, int len) {
    guarded(ud, [&](ParseState& st) {
        if (!st.stack.empty()) st.stack.back().text.append(s, static_cast<size_t>(len));
    });
}

void XMLCALL on_end(void* ud, const XML_Char*) {
    guarded(ud, [](ParseState& st) { end_element(st); });
}

struct ParserDeleter {
    void operator()(XML_ParserStruct* p) const { XML_ParserFree(p); }
};

} // namespace

json parse_xml(const std::string& xml) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        throw XmlParseError("XML document too large", 0, 0);
    }

    // The caller hands over UTF-8 whatever the declaration claims.
    std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreate("UTF-8"));
    if (!parser) throw std::runtime_error("failed to create XML parser");

    ParseState st;
    st.parser = parser.get();
    XML_SetUserData(parser.get(), &st);
    XML_SetElementHandler(parser.get(), on_start, on_end);
    XML_SetCharacterDataHandler(parser.get(), on_chars);

    const XML_Status status = XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), XML_TRUE);
    if (st.error) std::rethrow_exception(st.error);
    if (status == XML_STATUS_ERROR) {
        const long line = static_cast<long>(XML_GetCurrentLineNumber(parser.get()));
        const long col  = static_cast<long>(XML_GetCurrentColumnNumber(parser.get()));
        std::ostringstream oss;
        oss << "failed to parse XML: " << XML_ErrorString(XML_GetErrorCode(parser.get()))
            << " (line " << line << ", column " << col << ")";
        throw XmlParseError(oss.str(), line, col);
    }

    if (st.root.is_null()) throw XmlParseError("failed to parse XML: no root element", 0, 0);
    return st.root;
}

} // namespace xmlio
