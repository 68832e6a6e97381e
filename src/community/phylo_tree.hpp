#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// PhyloNode — one node of a rooted tree. `length` is the edge to the parent.
// ---------------------------------------------------------------------------
struct PhyloNode {
    int parent = -1;
    double length = 0.0;
    std::string label;
    std::vector<int> children;

    bool is_tip() const { return children.empty(); }
};

// ---------------------------------------------------------------------------
// PhyloTree — rooted tree with branch lengths relating the CDM species
// ---------------------------------------------------------------------------
class PhyloTree {
public:
    PhyloTree() = default;

    PhyloTree(std::vector<PhyloNode> nodes, int root)
        : nodes_(std::move(nodes)), root_(root) {
        if (nodes_.empty() || root_ < 0 || root_ >= static_cast<int>(nodes_.size())) {
            throw std::invalid_argument("Tree has no root");
        }
        index_tips();
        compute_depths();
    }

    // Parse a Newick string. A tree without any branch lengths gets unit lengths.
    static PhyloTree from_newick(const std::string& newick) {
        NewickParser parser(newick);
        return parser.parse();
    }

    size_t node_count() const { return nodes_.size(); }
    size_t tip_count() const { return tips_.size(); }
    int root() const { return root_; }
    const PhyloNode& node(int i) const { return nodes_[i]; }

    std::vector<std::string> tip_labels() const {
        std::vector<std::string> labels;
        labels.reserve(tips_.size());
        for (int t : tips_) labels.push_back(nodes_[t].label);
        return labels;
    }

    // Node index of the tip with this label, or -1.
    int tip_index(const std::string& label) const {
        auto it = tip_lookup_.find(label);
        return (it == tip_lookup_.end()) ? -1 : it->second;
    }

    // Root-to-node path length.
    double depth(int n) const { return depth_[n]; }

    // Keep only the named tips. Unary internal nodes are collapsed (their edge
    // lengths summed into the child) and the root moves down to the MRCA of the
    // kept tips.
    PhyloTree prune(const std::vector<std::string>& keep) const {
        std::vector<char> kept(nodes_.size(), 0);
        for (const auto& species : keep) {
            int t = tip_index(species);
            if (t < 0) {
                throw std::invalid_argument("Species not in tree: " + species);
            }
            for (int n = t; n >= 0 && !kept[n]; n = nodes_[n].parent) kept[n] = 1;
        }
        if (keep.empty()) {
            throw std::invalid_argument("Cannot prune tree to an empty species set");
        }

        int new_root = root_;
        for (;;) {
            auto kc = kept_children(new_root, kept);
            if (kc.size() != 1) break;
            new_root = kc[0];
        }

        std::vector<PhyloNode> out;
        copy_subtree(new_root, -1, 0.0, kept, out);
        return PhyloTree(std::move(out), 0);
    }

    // Phylogenetic variance-covariance: shared root path length of each tip pair.
    std::vector<std::vector<double>> tip_covariance(const std::vector<std::string>& order) const {
        auto idx = resolve(order);
        size_t n = idx.size();
        std::vector<std::vector<double>> vcv(n, std::vector<double>(n, 0.0));
        for (size_t i = 0; i < n; ++i) {
            vcv[i][i] = depth_[idx[i]];
            for (size_t j = i + 1; j < n; ++j) {
                double shared = depth_[mrca(idx[i], idx[j])];
                vcv[i][j] = shared;
                vcv[j][i] = shared;
            }
        }
        return vcv;
    }

    std::vector<std::vector<double>> tip_correlation(const std::vector<std::string>& order) const {
        auto c = tip_covariance(order);
        size_t n = c.size();
        std::vector<std::vector<double>> r(n, std::vector<double>(n, 0.0));
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                double denom = std::sqrt(c[i][i] * c[j][j]);
                r[i][j] = (denom > 0.0) ? c[i][j] / denom
                                        : std::numeric_limits<double>::quiet_NaN();
            }
        }
        return r;
    }

    // Cophenetic (patristic) distances between tips.
    std::vector<std::vector<double>> tip_distances(const std::vector<std::string>& order) const {
        auto idx = resolve(order);
        size_t n = idx.size();
        std::vector<std::vector<double>> d(n, std::vector<double>(n, 0.0));
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                double dist = depth_[idx[i]] + depth_[idx[j]] - 2.0 * depth_[mrca(idx[i], idx[j])];
                d[i][j] = dist;
                d[j][i] = dist;
            }
        }
        return d;
    }

    // Faith's PD: total length of the edges joining the present tips to the root.
    double pd(const std::vector<std::string>& present) const {
        std::vector<char> on_path(nodes_.size(), 0);
        double total = 0.0;
        for (const auto& species : resolve(present)) {
            for (int n = species; n != root_ && !on_path[n]; n = nodes_[n].parent) {
                on_path[n] = 1;
                total += nodes_[n].length;
            }
        }
        return total;
    }

private:
    std::vector<PhyloNode> nodes_;
    int root_ = -1;
    std::vector<int> tips_;
    std::unordered_map<std::string, int> tip_lookup_;
    std::vector<double> depth_;

    void index_tips() {
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (!nodes_[i].is_tip()) continue;
            if (nodes_[i].label.empty()) {
                throw std::invalid_argument("Tree has an unlabeled tip");
            }
            if (!tip_lookup_.emplace(nodes_[i].label, static_cast<int>(i)).second) {
                throw std::invalid_argument("Duplicate tip label: " + nodes_[i].label);
            }
            tips_.push_back(static_cast<int>(i));
        }
    }

    void compute_depths() {
        depth_.assign(nodes_.size(), 0.0);
        std::vector<int> stack = {root_};
        while (!stack.empty()) {
            int n = stack.back();
            stack.pop_back();
            for (int c : nodes_[n].children) {
                depth_[c] = depth_[n] + nodes_[c].length;
                stack.push_back(c);
            }
        }
    }

    std::vector<int> resolve(const std::vector<std::string>& labels) const {
        std::vector<int> idx;
        idx.reserve(labels.size());
        for (const auto& label : labels) {
            int t = tip_index(label);
            if (t < 0) throw std::invalid_argument("Species not in tree: " + label);
            idx.push_back(t);
        }
        return idx;
    }

    int mrca(int a, int b) const {
        std::set<int> ancestors;
        for (int n = a; n >= 0; n = nodes_[n].parent) ancestors.insert(n);
        for (int n = b; n >= 0; n = nodes_[n].parent) {
            if (ancestors.count(n)) return n;
        }
        return root_;
    }

    std::vector<int> kept_children(int n, const std::vector<char>& kept) const {
        std::vector<int> out;
        for (int c : nodes_[n].children) {
            if (kept[c]) out.push_back(c);
        }
        return out;
    }

    int copy_subtree(int n, int parent, double length, const std::vector<char>& kept,
                     std::vector<PhyloNode>& out) const {
        auto kc = kept_children(n, kept);
        if (!nodes_[n].is_tip() && kc.size() == 1) {
            return copy_subtree(kc[0], parent, length + nodes_[kc[0]].length, kept, out);
        }
        int idx = static_cast<int>(out.size());
        out.push_back(PhyloNode{parent, length, nodes_[n].label, {}});
        for (int c : kc) {
            int ci = copy_subtree(c, idx, nodes_[c].length, kept, out);
            out[idx].children.push_back(ci);
        }
        return idx;
    }

    // -----------------------------------------------------------------------
    // NewickParser — recursive descent over "(A:1,(B:2,C:3):1);"
    // -----------------------------------------------------------------------
    class NewickParser {
    public:
        explicit NewickParser(const std::string& text) : text_(text) {}

        PhyloTree parse() {
            skip_ws();
            int root = parse_subtree(-1);
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ';') ++pos_;
            skip_ws();
            if (pos_ != text_.size()) fail("trailing characters");

            if (with_length_ == 0) {
                for (auto& n : nodes_) n.length = 1.0;
            } else if (without_length_ > 0) {
                fail("some branches have lengths and others do not");
            }
            nodes_[root].length = 0.0;
            return PhyloTree(std::move(nodes_), root);
        }

    private:
        const std::string& text_;
        size_t pos_ = 0;
        std::vector<PhyloNode> nodes_;
        int with_length_ = 0;
        int without_length_ = 0;

        [[noreturn]] void fail(const std::string& why) const {
            throw std::invalid_argument("Malformed Newick at offset " + std::to_string(pos_) +
                                        ": " + why);
        }

        void skip_ws() {
            while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
        }

        int parse_subtree(int parent) {
            int idx = static_cast<int>(nodes_.size());
            nodes_.push_back(PhyloNode{parent, 0.0, "", {}});

            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == '(') {
                ++pos_;
                for (;;) {
                    int child = parse_subtree(idx);
                    nodes_[idx].children.push_back(child);
                    skip_ws();
                    if (pos_ >= text_.size()) fail("unterminated '('");
                    if (text_[pos_] == ',') { ++pos_; continue; }
                    if (text_[pos_] == ')') { ++pos_; break; }
                    fail("expected ',' or ')'");
                }
            }

            nodes_[idx].label = parse_label();
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ':') {
                ++pos_;
                nodes_[idx].length = parse_number();
                if (parent >= 0) ++with_length_;
            } else if (parent >= 0) {
                ++without_length_;
            }
            if (nodes_[idx].children.empty() && nodes_[idx].label.empty()) {
                fail("tip without a label");
            }
            return idx;
        }

        std::string parse_label() {
            skip_ws();
            std::string label;
            if (pos_ < text_.size() && text_[pos_] == '\'') {
                ++pos_;
                while (pos_ < text_.size() && text_[pos_] != '\'') label += text_[pos_++];
                if (pos_ >= text_.size()) fail("unterminated quoted label");
                ++pos_;
                return label;
            }
            while (pos_ < text_.size()) {
                char c = text_[pos_];
                if (c == '(' || c == ')' || c == ',' || c == ':' || c == ';' ||
                    std::isspace(static_cast<unsigned char>(c))) {
                    break;
                }
                label += c;
                ++pos_;
            }
            return label;
        }

        double parse_number() {
            skip_ws();
            size_t start = pos_;
            while (pos_ < text_.size()) {
                char c = text_[pos_];
                if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' ||
                    c == '+' || c == 'e' || c == 'E') {
                    ++pos_;
                } else {
                    break;
                }
            }
            if (start == pos_) fail("expected branch length");
            try {
                return std::stod(text_.substr(start, pos_ - start));
            } catch (const std::exception&) {
                fail("bad branch length");
            }
        }
    };
};
