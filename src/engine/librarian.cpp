#include "librarian.hpp"
#include "incidex/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace incidex::engine {

    namespace {

        Embedding normalized(const Embedding& v) {
            float norm = 0.0f;
            for (float x : v) norm += x * x;
            norm = std::sqrt(norm);
            if (norm == 0.0f) return v;
            Embedding out(v.size());
            for (size_t i = 0; i < v.size(); ++i) out[i] = v[i] / norm;
            return out;
        }

        class AllowedLabels : public hnswlib::BaseFilterFunctor {
        public:
            explicit AllowedLabels(const std::unordered_set<size_t>& labels) : m_labels(labels) {}
            bool operator()(hnswlib::labeltype id) override { return m_labels.count(id) > 0; }

        private:
            const std::unordered_set<size_t>& m_labels;
        };

    }

    struct Librarian::Impl {
        hnswlib::InnerProductSpace space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_hnsw;

        Impl(size_t dim, size_t max_elements) : space(dim) {
            alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(&space, max_elements);
        }
    };

    Librarian::Librarian(size_t dim, size_t max_elements) : m_dim(dim) {
        m_impl = std::make_unique<Impl>(dim, std::max<size_t>(max_elements, 16));
    }

    Librarian::~Librarian() = default;

    void Librarian::add_item(size_t label, const Embedding& vector) {
        if (vector.size() != m_dim) {
            throw Error(ErrorKind::StoreFailure, "vector dimension mismatch: expected " + std::to_string(m_dim) +
                                                 ", got " + std::to_string(vector.size()));
        }
        for (float x : vector) {
            if (!std::isfinite(x)) {
                throw Error(ErrorKind::StoreFailure, "vector for label " + std::to_string(label) +
                                                     " has a non-finite component");
            }
        }
        auto& index = *m_impl->alg_hnsw;
        if (index.getCurrentElementCount() >= index.getMaxElements()) {
            index.resizeIndex(index.getMaxElements() * 2);
        }
        Embedding unit = normalized(vector);
        try {
            index.addPoint(unit.data(), label);
        } catch (const std::exception& e) {
            throw Error(ErrorKind::StoreFailure, std::string("index insert failed: ") + e.what());
        }
    }

    std::vector<std::pair<size_t, float>> Librarian::search(const Embedding& query_vector, size_t k,
                                                            const std::unordered_set<size_t>* allowed) const {
        std::vector<std::pair<size_t, float>> results;
        if (query_vector.size() != m_dim) {
            throw Error(ErrorKind::StoreFailure, "query dimension mismatch: expected " + std::to_string(m_dim) +
                                                 ", got " + std::to_string(query_vector.size()));
        }
        if (k == 0 || count() == 0) return results;

        Embedding unit = normalized(query_vector);
        auto& index = *m_impl->alg_hnsw;
        index.setEf(std::max<size_t>(k, 64));

        try {
            // searchKnn returns a max-heap of <distance, label>
            std::unique_ptr<AllowedLabels> filter;
            if (allowed) filter = std::make_unique<AllowedLabels>(*allowed);
            auto pq = index.searchKnn(unit.data(), k, filter.get());

            while (!pq.empty()) {
                results.emplace_back(static_cast<size_t>(pq.top().second), pq.top().first);
                pq.pop();
            }
            // Result is furthest to nearest, so reverse it
            std::reverse(results.begin(), results.end());
        } catch (const std::exception& e) {
            throw Error(ErrorKind::StoreFailure, std::string("index search failed: ") + e.what());
        }
        return results;
    }

    void Librarian::save(const std::filesystem::path& path) const {
        try {
            m_impl->alg_hnsw->saveIndex(path.string());
        } catch (const std::exception& e) {
            std::cerr << "[Librarian] Save error: " << e.what() << "\n";
        }
    }

    bool Librarian::load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) return false;
        try {
            m_impl->alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(&m_impl->space, path.string());
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[Librarian] Load error: " << e.what() << "\n";
            m_impl->alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(&m_impl->space, 16);
            return false;
        }
    }

    size_t Librarian::count() const {
        return m_impl->alg_hnsw->getCurrentElementCount() - m_impl->alg_hnsw->getDeletedCount();
    }

}
