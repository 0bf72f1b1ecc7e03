#include "JsonUtil.h"
#include <cstdio>
#include <cmath>

namespace netgrave {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 8);
    for(char ch : s){
        unsigned char c = static_cast<unsigned char>(ch);
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if(c < 0x20){
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

std::string pretty(const std::string& compact_json){
    std::string out;
    out.reserve(compact_json.size() * 2);
    int indent = 0;
    bool in_string = false;
    auto newline = [&](){ out += '\n'; out.append(static_cast<size_t>(indent) * 2, ' '); };
    for(size_t i = 0; i < compact_json.size(); ++i){
        char c = compact_json[i];
        if(in_string){
            out += c;
            if(c == '\\' && i + 1 < compact_json.size()){ out += compact_json[++i]; }
            else if(c == '"') in_string = false;
            continue;
        }
        switch(c){
            case '"': in_string = true; out += c; break;
            case '{': case '[': {
                char close = c == '{' ? '}' : ']';
                if(i + 1 < compact_json.size() && compact_json[i + 1] == close){
                    out += c; out += close; ++i; break;
                }
                out += c; ++indent; newline(); break;
            }
            case '}': case ']': --indent; newline(); out += c; break;
            case ',': out += c; newline(); break;
            case ':': out += ": "; break;
            default: out += c;
        }
    }
    out += '\n';
    return out;
}

std::string format_double(double v){
    if(!std::isfinite(v)) return "0";
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

}
}
