#include "socialxml/socialxml.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

// users with posts and follower links to their two predecessors
static std::string make_network(int users, bool pretty){
    const char* nl = pretty ? "\n" : "";
    std::string s = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
    s += nl; s += "<users>"; s += nl;
    for(int u = 1; u <= users; ++u){
        s += "<user>"; s += nl;
        s += "<id>" + std::to_string(u) + "</id>"; s += nl;
        s += "<name>User " + std::to_string(u) + "</name>"; s += nl;
        s += "<posts><post><body>Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod "
             "tempor incididunt ut labore et dolore magna aliqua.</body>";
        s += "<topics><topic>economy</topic><topic>finance</topic></topics></post></posts>"; s += nl;
        s += "<followers>";
        for(int f = u - 2; f < u; ++f)
            if(f >= 1) s += "<follower><id>" + std::to_string(f) + "</id></follower>";
        s += "</followers>"; s += nl;
        s += "</user>"; s += nl;
    }
    s += "</users>";
    return s;
}

struct RunResult { double ms_validate; double ms_format; double ms_minify; size_t errors; size_t out_bytes; };

static RunResult bench_case(const char* name, const std::string& doc){
    auto t0 = Clock::now();
    auto vr = socialxml::validate(doc);
    auto t1 = Clock::now();
    std::string pretty = socialxml::format(doc);
    auto t2 = Clock::now();
    std::string small = socialxml::minify(doc);
    auto t3 = Clock::now();
    if(!vr.is_valid)
        std::cerr << "[bench] case '" << name << "' reported " << vr.error_count << " validation errors\n";
    auto ms = [](Clock::time_point a, Clock::time_point b){ return std::chrono::duration<double, std::milli>(b - a).count(); };
    return { ms(t0, t1), ms(t1, t2), ms(t2, t3), vr.error_count, pretty.size() + small.size() };
}

int main(int argc, char** argv){
    int scale = 1;
    if(argc > 1) scale = std::max(1, std::atoi(argv[1]));

    struct Case { const char* name; std::string doc; };
    std::vector<Case> cases;
    cases.push_back({ "compact_100", make_network(100 * scale, false) });
    cases.push_back({ "lines_100", make_network(100 * scale, true) });
    cases.push_back({ "lines_2000", make_network(2000 * scale, true) });

    std::cout << "name,bytes,ms_validate,ms_format,ms_minify,errors,out_bytes\n";
    for(const auto& c : cases){
        auto r = bench_case(c.name, c.doc);
        std::cout << c.name << "," << c.doc.size() << "," << r.ms_validate << "," << r.ms_format << ","
                  << r.ms_minify << "," << r.errors << "," << r.out_bytes << "\n";
    }
    return 0;
}
