#include <store/graph_csv.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cctype>
#include <cmath>
#include <charconv>
#include <fstream>
#include <sstream>

namespace Arbor {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string part;
    while (std::getline(ss, part, ',')) parts.push_back(trim(part));
    if (!line.empty() && line.back() == ',') parts.emplace_back();
    return parts;
}

class LineReader {
public:
    LineReader(std::istream& in, const std::string& source) : in_(in), source_(source) {}

    // Next data row, header and comments skipped; false at end of input
    bool next(std::vector<std::string>& fields) {
        std::string line;
        while (std::getline(in_, line)) {
            ++line_no_;
            line = trim(line);
            if (line.empty() || line.front() == '#') continue;

            fields = split(line);
            if (!seen_row_) {
                seen_row_ = true;
                if (!fields.empty() && !looks_numeric(fields[0])) continue;
            }
            return true;
        }
        return false;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw DataIntegrityError(source_ + ":" + std::to_string(line_no_) + ": " + what);
    }

    template <typename T>
    T integer(const std::string& field, const char* column) const {
        T value{};
        auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
        if (field.empty() || ec != std::errc() || ptr != field.data() + field.size()) {
            fail(std::string("bad ") + column + " '" + field + "'");
        }
        return value;
    }

    double real(const std::string& field, const char* column) const {
        size_t pos = 0;
        double value = 0.0;
        try {
            value = std::stod(field, &pos);
        } catch (const std::logic_error&) {
            fail(std::string("bad ") + column + " '" + field + "'");
        }
        if (pos != field.size()) {
            fail(std::string("bad ") + column + " '" + field + "'");
        }
        // stod accepts "nan" and "inf"
        if (!std::isfinite(value)) {
            fail(std::string("non-finite ") + column + " '" + field + "'");
        }
        return value;
    }

private:
    static bool looks_numeric(const std::string& field) {
        return !field.empty() && (std::isdigit(static_cast<unsigned char>(field[0])) || field[0] == '-');
    }

    std::istream& in_;
    std::string source_;
    size_t line_no_ = 0;
    bool seen_row_ = false;
};

} // namespace

std::vector<Node> GraphCsv::parse_nodes(std::istream& in, const std::string& source) {
    LineReader reader(in, source);
    std::vector<Node> nodes;
    std::vector<std::string> f;

    while (reader.next(f)) {
        if (f.size() < 5 || f.size() > 6) {
            reader.fail("expected id,x,y,cluster_id,degree[,year], got " + std::to_string(f.size()) + " fields");
        }
        Node n;
        n.id = reader.integer<int64_t>(f[0], "id");
        n.position = Eigen::Vector2d(reader.real(f[1], "x"), reader.real(f[2], "y"));
        n.cluster_id = f[3].empty() ? -1 : reader.integer<int32_t>(f[3], "cluster_id");
        n.degree = f[4].empty() ? 0 : reader.integer<int32_t>(f[4], "degree");
        if (f.size() == 6 && !f[5].empty()) {
            n.year = reader.integer<int32_t>(f[5], "year");
        }
        nodes.push_back(n);
    }
    return nodes;
}

std::vector<CitationEdge> GraphCsv::parse_edges(std::istream& in, const std::string& source) {
    LineReader reader(in, source);
    std::vector<CitationEdge> edges;
    std::vector<std::string> f;

    while (reader.next(f)) {
        if (f.size() != 2) {
            reader.fail("expected src,dst, got " + std::to_string(f.size()) + " fields");
        }
        edges.push_back({reader.integer<int64_t>(f[0], "src"), reader.integer<int64_t>(f[1], "dst")});
    }
    return edges;
}

std::vector<Node> GraphCsv::read_nodes(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open " + path);
    return parse_nodes(file, path);
}

std::vector<CitationEdge> GraphCsv::read_edges(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open " + path);
    return parse_edges(file, path);
}

std::unique_ptr<MemoryGraphStore> GraphCsv::load(const std::string& nodes_path, const std::string& edges_path) {
    Logger::step("Reading " + nodes_path + " and " + edges_path);
    Timer timer;

    auto nodes = read_nodes(nodes_path);
    auto edges = read_edges(edges_path);

    Logger::success("Read " + std::to_string(nodes.size()) + " nodes and " + std::to_string(edges.size()) +
                    " citations (" + std::to_string(timer.elapsed().count()) + "ms)");
    return std::make_unique<MemoryGraphStore>(std::move(nodes), std::move(edges));
}

} // namespace Arbor
