// TSAM - table_io.cpp

#include "io/table_io.h"
#include "util/errors.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <unordered_map>

namespace tsam {

namespace {

struct Table {
    std::string path;
    char delimiter = ',';
    std::unordered_map<std::string, size_t> columns;
    std::vector<std::pair<int, std::vector<std::string>>> rows;   // (line number, fields)
};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(begin, end - begin + 1);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            field += c;
        } else if (c == delim && !quoted) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

bool blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::ifstream open_input(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open input file: " + path);
    return in;
}

std::ofstream open_output(const std::string& path) {
    std::ofstream out(path);
    if (!out) throw ConfigError("Cannot open output file: " + path);
    return out;
}

Table read_table(const std::string& path) {
    std::ifstream in = open_input(path);
    Table t;
    t.path = path;

    std::string line;
    int line_no = 0;
    bool have_header = false;
    while (std::getline(in, line)) {
        ++line_no;
        if (blank(line)) continue;
        if (!have_header) {
            t.delimiter = line.find('\t') != std::string::npos ? '\t' : ',';
            const auto names = split(line, t.delimiter);
            for (size_t i = 0; i < names.size(); ++i) {
                t.columns[names[i]] = i;
            }
            have_header = true;
            continue;
        }
        t.rows.emplace_back(line_no, split(line, t.delimiter));
    }
    if (!have_header) throw ConfigError(path + ": file is empty");
    return t;
}

size_t column(const Table& t, const std::string& name) {
    auto it = t.columns.find(name);
    if (it == t.columns.end()) {
        throw ConfigError(t.path + ": missing column '" + name + "'");
    }
    return it->second;
}

const std::string& field(const Table& t, const std::pair<int, std::vector<std::string>>& row,
                         size_t col) {
    if (col >= row.second.size()) {
        throw ConfigError(t.path + ":" + std::to_string(row.first) + ": too few fields");
    }
    return row.second[col];
}

double parse_number(const std::string& text, const std::string& where) {
    if (text.empty()) throw ConfigError(where + ": empty numeric field");
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
        throw ConfigError(where + ": cannot parse number '" + text + "'");
    }
    return v;
}

}  // namespace

std::vector<Observation> read_observations(const std::string& path) {
    const Table t = read_table(path);
    const size_t c_height = column(t, "height");
    const size_t c_range = column(t, "range");
    const size_t c_age = column(t, "age");
    const size_t c_unc = column(t, "ageUnc");
    const size_t c_type = column(t, "type");

    std::vector<Observation> obs;
    obs.reserve(t.rows.size());
    for (const auto& row : t.rows) {
        const std::string where = path + ":" + std::to_string(row.first);
        Observation o;
        o.height = parse_number(field(t, row, c_height), where);
        o.height_uncertainty = parse_number(field(t, row, c_range), where);
        o.age = parse_number(field(t, row, c_age), where);
        o.age_uncertainty = parse_number(field(t, row, c_unc), where);
        o.height_shape = parse_uncertainty_shape(field(t, row, c_type));
        obs.push_back(o);
    }
    return obs;
}

CompositePosterior read_posterior(const std::string& path) {
    const Table t = read_table(path);
    const size_t c_a = column(t, "a");
    const size_t c_b = column(t, "b");
    const size_t c_s = column(t, "sigma");

    CompositePosterior post;
    post.reserve(t.rows.size());
    for (const auto& row : t.rows) {
        const std::string where = path + ":" + std::to_string(row.first);
        PosteriorDraw d;
        d.a = parse_number(field(t, row, c_a), where);
        d.b = parse_number(field(t, row, c_b), where);
        d.sigma = parse_number(field(t, row, c_s), where);
        post.push_back(d);
    }
    if (post.empty()) throw ConfigError(path + ": posterior has no draws");
    return post;
}

std::vector<double> read_heights(const std::string& path) {
    std::ifstream in = open_input(path);
    std::vector<double> heights;
    std::string line;
    int line_no = 0;
    long height_col = -1;
    char delim = ',';
    bool first = true;

    while (std::getline(in, line)) {
        ++line_no;
        if (blank(line)) continue;
        if (first) {
            first = false;
            delim = line.find('\t') != std::string::npos ? '\t' : ',';
            const auto names = split(line, delim);
            for (size_t i = 0; i < names.size(); ++i) {
                if (names[i] == "height") height_col = static_cast<long>(i);
            }
            if (height_col >= 0) continue;
            height_col = 0;   // headerless list
        }
        const auto fields = split(line, delim);
        if (static_cast<size_t>(height_col) >= fields.size()) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": too few fields");
        }
        heights.push_back(parse_number(fields[height_col], path + ":" + std::to_string(line_no)));
    }
    return heights;
}

void write_posterior(const std::string& path, const CompositePosterior& posterior) {
    std::ofstream out = open_output(path);
    out << "a,b,sigma\n";
    out << std::setprecision(10);
    for (const auto& d : posterior) {
        out << d.a << "," << d.b << "," << d.sigma << "\n";
    }
}

void write_age_model(const std::string& path, const std::vector<AgeSummary>& summaries) {
    std::ofstream out = open_output(path);
    out << "height,age_median,age_min,age_max\n";
    out << std::setprecision(8);
    for (const auto& s : summaries) {
        out << s.height << "," << s.median << "," << s.lower << "," << s.upper << "\n";
    }
}

void write_parameter_summary(const std::string& path, const std::vector<ParameterSummary>& params) {
    std::ofstream out = open_output(path);
    out << "parameter,mean,sd,median,lower,upper\n";
    out << std::setprecision(8);
    for (const auto& p : params) {
        out << p.name << "," << p.mean << "," << p.sd << "," << p.median << ","
            << p.lower << "," << p.upper << "\n";
    }
}

}  // namespace tsam
