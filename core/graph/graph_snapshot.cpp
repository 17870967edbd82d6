#include "graph/graph_snapshot.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace biokg {

namespace {

constexpr char MAGIC[4] = {'B', 'K', 'G', 'S'};
constexpr uint32_t MAX_STRING_LENGTH = 256u * 1024u * 1024u;

uint32_t checksum(const char* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // crc32 takes a uInt length; feed large buffers in chunks.
    while (length > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(length, 1u << 30));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        length -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

class Writer {
public:
    template <typename T>
    void put(T value) {
        char raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        buffer_.append(raw, sizeof(T));
    }

    void putString(const std::string& s) {
        put<uint32_t>(static_cast<uint32_t>(s.size()));
        buffer_.append(s);
    }

    void putRaw(const char* data, size_t n) { buffer_.append(data, n); }

    std::string& buffer() { return buffer_; }

private:
    std::string buffer_;
};

class Reader {
public:
    Reader(const char* data, size_t size) : data_(data), size_(size) {}

    template <typename T>
    T get() {
        require(sizeof(T));
        T value;
        std::memcpy(&value, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return value;
    }

    std::string getString() {
        uint32_t len = get<uint32_t>();
        if (len > MAX_STRING_LENGTH) {
            throw SnapshotError("Snapshot string length " + std::to_string(len) + " exceeds limit");
        }
        require(len);
        std::string s(data_ + pos_, len);
        pos_ += len;
        return s;
    }

    void expectRaw(const char* expected, size_t n, const std::string& what) {
        require(n);
        if (std::memcmp(data_ + pos_, expected, n) != 0) {
            throw SnapshotError("Not a graph snapshot (bad " + what + ")");
        }
        pos_ += n;
    }

    bool atEnd() const { return pos_ == size_; }

private:
    void require(size_t n) const {
        if (size_ - pos_ < n) {
            throw SnapshotError("Snapshot truncated at byte " + std::to_string(pos_));
        }
    }

    const char* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace

// ─── Save ──────────────────────────────────────────────────────

std::string GraphSnapshot::save(const Graph& graph) {
    Writer w;
    w.putRaw(MAGIC, sizeof(MAGIC));
    w.put<uint32_t>(FORMAT_VERSION);
    w.put<uint64_t>(graph.nodeCount());
    w.put<uint64_t>(graph.edgeCount());

    graph.forEachNode([&](const Node& n) {
        w.put<int64_t>(n.id);
        w.putString(n.type);
        w.putString(n.name);
        w.putString(n.source);
        w.putString(n.accession);

        // Sorted keys keep the byte stream deterministic.
        std::vector<const std::pair<const std::string, std::string>*> attrs;
        attrs.reserve(n.attributes.size());
        for (const auto& kv : n.attributes) attrs.push_back(&kv);
        std::sort(attrs.begin(), attrs.end(),
                  [](const auto* a, const auto* b) { return a->first < b->first; });

        w.put<uint32_t>(static_cast<uint32_t>(attrs.size()));
        for (const auto* kv : attrs) {
            w.putString(kv->first);
            w.putString(kv->second);
        }
    });

    graph.forEachEdge([&](const Edge& e) {
        w.put<uint64_t>(e.source);
        w.put<uint64_t>(e.target);
        w.putString(e.relation);
        w.putString(e.display_relation);
    });

    uint32_t crc = checksum(w.buffer().data(), w.buffer().size());
    w.put<uint32_t>(crc);
    return std::move(w.buffer());
}

// ─── Load ──────────────────────────────────────────────────────

Graph GraphSnapshot::load(const std::string& bytes) {
    if (bytes.size() < sizeof(uint32_t)) {
        throw SnapshotError("Snapshot too small");
    }
    const size_t payload_size = bytes.size() - sizeof(uint32_t);
    uint32_t stored_crc = 0;
    std::memcpy(&stored_crc, bytes.data() + payload_size, sizeof(uint32_t));
    if (checksum(bytes.data(), payload_size) != stored_crc) {
        throw SnapshotError("Snapshot checksum mismatch");
    }

    Reader r(bytes.data(), payload_size);
    r.expectRaw(MAGIC, sizeof(MAGIC), "magic");
    uint32_t version = r.get<uint32_t>();
    if (version != FORMAT_VERSION) {
        throw SnapshotError("Unsupported snapshot version " + std::to_string(version));
    }
    uint64_t node_count = r.get<uint64_t>();
    uint64_t edge_count = r.get<uint64_t>();

    Graph graph;
    // Every node and edge takes more than 8 bytes, so the counts are bounded
    // by the payload size; this keeps reserve() sane on hostile input.
    if (node_count > payload_size / 8 || edge_count > payload_size / 8) {
        throw SnapshotError("Snapshot counts exceed payload size");
    }
    graph.reserve(node_count, edge_count);

    for (uint64_t i = 0; i < node_count; i++) {
        int64_t id = r.get<int64_t>();
        std::string type = r.getString();
        std::string name = r.getString();
        std::string source = r.getString();
        std::string accession = r.getString();

        uint64_t index = graph.addNode(id, type, name, source, accession);
        if (index != i) {
            throw SnapshotError("Snapshot contains duplicate node (" + type + ", " +
                                std::to_string(id) + ")");
        }

        uint32_t attr_count = r.get<uint32_t>();
        for (uint32_t a = 0; a < attr_count; a++) {
            std::string key = r.getString();
            std::string value = r.getString();
            graph.setAttribute(index, key, value);
        }
    }

    for (uint64_t i = 0; i < edge_count; i++) {
        uint64_t source = r.get<uint64_t>();
        uint64_t target = r.get<uint64_t>();
        std::string relation = r.getString();
        std::string display = r.getString();
        if (!graph.containsIndex(source) || !graph.containsIndex(target)) {
            throw SnapshotError("Snapshot edge " + std::to_string(i) + " references a missing node");
        }
        if (!graph.addEdge(source, target, relation, display)) {
            throw SnapshotError("Snapshot contains duplicate edge " + std::to_string(i));
        }
    }

    if (!r.atEnd()) {
        throw SnapshotError("Trailing bytes after snapshot payload");
    }
    return graph;
}

// ─── Files ─────────────────────────────────────────────────────

void GraphSnapshot::saveToFile(const Graph& graph, const std::string& path) {
    std::string bytes = save(graph);

    // Write beside the target, then rename over it.
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw SnapshotError("Cannot open snapshot for writing: " + tmp_path);
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw SnapshotError("Failed writing snapshot: " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw SnapshotError("Cannot replace snapshot " + path + ": " + ec.message());
    }
    BIOKG_LOG_INFO("Snapshot saved to " + path + " (" + std::to_string(bytes.size()) + " bytes, " +
                   std::to_string(graph.nodeCount()) + " nodes, " +
                   std::to_string(graph.edgeCount()) + " edges)");
}

Graph GraphSnapshot::loadFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SnapshotError("Cannot open snapshot: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw SnapshotError("Failed reading snapshot: " + path);
    }

    Graph graph = load(buffer.str());
    BIOKG_LOG_INFO("Snapshot loaded from " + path + " (" + std::to_string(graph.nodeCount()) +
                   " nodes, " + std::to_string(graph.edgeCount()) + " edges)");
    return graph;
}

} // namespace biokg
