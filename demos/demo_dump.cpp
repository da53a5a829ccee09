#include <lexforge/config.hpp>
#include <lexforge/lang/tokenizer.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace lexforge;

// Token values can span lines; show control characters escaped
static std::string escaped(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    return out;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: lexforge-dump <input> <rules.toml> [more-rules.toml...]\n";
        return 1;
    }

    std::string path = argv[1];

    // Later rule files layer on top of earlier ones
    Config config;
    for (int i = 2; i < argc; ++i) {
        auto cr = Config::load(argv[i]);
        if (cr.is_err()) {
            std::cerr << cr.error().format() << "\n";
            return 1;
        }
        config.merge(cr.value());
    }

    auto tr = Tokenizer::from_config(config);
    if (tr.is_err()) {
        std::cerr << tr.error().format() << "\n";
        return 1;
    }

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    auto r = tr.value().tokenize(source);
    if (r.is_err()) {
        for (const auto& e : r.error()) {
            std::cerr << e.format(path) << "\n";
        }
        std::cerr << r.error().size() << " error(s)\n";
        return 1;
    }

    std::cout << "--- " << path << " ---\n";
    std::cout << "Scanners: " << tr.value().scanners().size()
              << "  Tokens: " << r.value().size() << "\n\n";

    for (const auto& t : r.value()) {
        std::cout << "  " << t.pos.line << ":" << t.pos.col << "  " << t.type;
        if (t.sub_type) std::cout << "/" << *t.sub_type;
        std::cout << "  \"" << escaped(t.value) << "\"\n";
    }

    return 0;
}
