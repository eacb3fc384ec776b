/**
 * Genetic code tables
 *
 * Forward and reverse-complement codon tables, residue -> codon inversions,
 * degenerate codon resolution and the per-table matcher cache.
 */

#include "orfkit/genetic_code.hpp"
#include "orfkit/errors.hpp"

#include <algorithm>
#include <cctype>

namespace orfkit {

namespace {

// Marks start codons in the matcher cache and in resolve_key()
constexpr char START_KEY = '^';

struct Registry {
    std::mutex mutex;
    std::map<int, std::shared_ptr<const GeneticCode>> tables;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

const GeneticCodeDefinition* find_definition(int id) {
    const auto& defs = ncbi_genetic_codes();
    auto it = std::find_if(defs.begin(), defs.end(),
                           [id](const GeneticCodeDefinition& d) { return d.id == id; });
    return it == defs.end() ? nullptr : &*it;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

void require_strand(int strand) {
    if (strand != 1 && strand != -1) throw InvalidStrand(strand);
}

}  // namespace

GeneticCode::GeneticCode(int id, std::string name,
                         std::string_view residues, std::string_view starts)
    : id_(id), name_(std::move(name)) {
    if (residues.size() != NUM_CODONS) {
        throw InvalidTableDefinition("Genetic code " + std::to_string(id) +
                                     ": expected 64 residues, got " +
                                     std::to_string(residues.size()));
    }
    if (starts.size() != NUM_CODONS) {
        throw InvalidTableDefinition("Genetic code " + std::to_string(id) +
                                     ": expected 64 start flags, got " +
                                     std::to_string(starts.size()));
    }

    for (size_t i = 0; i < NUM_CODONS; ++i) {
        char aa = fast_upper(residues[i]);
        if (AMINO_ACIDS.find(aa) == std::string_view::npos) {
            throw InvalidTableDefinition("Genetic code " + std::to_string(id) +
                                         ": invalid residue '" + std::string(1, residues[i]) +
                                         "' for codon " + idx_to_codon(static_cast<int>(i)));
        }
        concrete_[0][i] = aa;
        starts_[0][i] = fast_upper(starts[i]) == 'M';
    }

    // Reverse strand: complement each base and reverse the codon, keep the residue
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        std::string rc = reverse_complement(idx_to_codon(i));
        int j = codon_to_idx(rc[0], rc[1], rc[2]);
        concrete_[1][j] = concrete_[0][i];
        starts_[1][j] = starts_[0][i];
    }

    for (int slot = 0; slot < 2; ++slot) {
        for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
            residue_codons_[slot][concrete_[slot][i]].push_back(idx_to_codon(i));
            if (starts_[slot][i]) start_codons_[slot].push_back(idx_to_codon(i));
        }

        // Degenerate resolution over every non-empty mask triple
        auto& resolved = resolved_[slot];
        resolved.fill(UNKNOWN_RESIDUE);
        std::string seen;
        for (int m1 = 1; m1 < 16; ++m1) {
            for (int m2 = 1; m2 < 16; ++m2) {
                for (int m3 = 1; m3 < 16; ++m3) {
                    seen.clear();
                    for (int b1 = 0; b1 < 4; ++b1) {
                        if (!(m1 & (1 << b1))) continue;
                        for (int b2 = 0; b2 < 4; ++b2) {
                            if (!(m2 & (1 << b2))) continue;
                            for (int b3 = 0; b3 < 4; ++b3) {
                                if (!(m3 & (1 << b3))) continue;
                                char aa = concrete_[slot][b1 * 16 + b2 * 4 + b3];
                                if (seen.find(aa) == std::string::npos) seen += aa;
                            }
                        }
                    }
                    resolved[(m1 << 8) | (m2 << 4) | m3] = ambiguous_residue(seen);
                }
            }
        }
    }
}

std::shared_ptr<const GeneticCode> GeneticCode::get(int id) {
    auto& reg = registry();
    {
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.tables.find(id);
        if (it != reg.tables.end()) return it->second;
    }

    const GeneticCodeDefinition* def = find_definition(id);
    if (!def) throw UnknownTableId(id);

    // Built outside the lock; a concurrent build of the same id yields an
    // identical table and the first one published wins.
    std::shared_ptr<const GeneticCode> table(
        new GeneticCode(def->id, def->name, def->residues, def->starts));

    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.tables.emplace(id, std::move(table)).first->second;
}

std::shared_ptr<const GeneticCode> GeneticCode::by_name(std::string_view name) {
    for (const auto& def : ncbi_genetic_codes()) {
        if (iequals(def.name, name)) return get(def.id);
    }
    throw UnknownTableId(std::string(name));
}

std::vector<int> GeneticCode::available_ids() {
    std::vector<int> ids;
    for (const auto& def : ncbi_genetic_codes()) ids.push_back(def.id);
    return ids;
}

std::shared_ptr<const GeneticCode> GeneticCode::custom(int id, std::string name,
                                                       std::string_view residues,
                                                       std::string_view starts) {
    return std::shared_ptr<const GeneticCode>(
        new GeneticCode(id, std::move(name), residues, starts));
}

char GeneticCode::residue(std::string_view codon, int strand) const {
    require_strand(strand);
    if (codon.size() != 3) {
        throw Error("Codon must be 3 nucleotides: '" + std::string(codon) + "'");
    }
    return residue_at(codon.data(), strand);
}

bool GeneticCode::is_start(std::string_view codon, int strand) const {
    require_strand(strand);
    return codon.size() == 3 && is_start_at(codon.data(), strand);
}

const std::vector<std::string>& GeneticCode::codons(char residue, int strand) const {
    static const std::vector<std::string> none;
    require_strand(strand);
    const auto& by_residue = residue_codons_[strand_slot(strand)];
    auto it = by_residue.find(fast_upper(residue));
    return it == by_residue.end() ? none : it->second;
}

const std::vector<std::string>& GeneticCode::start_codons(int strand) const {
    require_strand(strand);
    return start_codons_[strand_slot(strand)];
}

char GeneticCode::resolve_key(std::string_view key, int strand) {
    if (key == "start") return START_KEY;
    if (key == "lower") return strand == 1 ? START_KEY : STOP_RESIDUE;
    if (key == "upper") return strand == 1 ? STOP_RESIDUE : START_KEY;

    if (key.size() == 1) {
        char aa = fast_upper(key[0]);
        if (AMINO_ACIDS.find(aa) != std::string_view::npos) return aa;
    }
    throw InvalidResidue("Invalid residue: '" + std::string(key) + "'");
}

std::bitset<NUM_CODONS> GeneticCode::concrete_set(char key, int slot) const {
    if (key == START_KEY) return starts_[slot];

    std::bitset<NUM_CODONS> set;
    for (size_t i = 0; i < NUM_CODONS; ++i) {
        if (concrete_[slot][i] == key) set.set(i);
    }
    return set;
}

const CodonMatcher& GeneticCode::matcher(std::string_view key, int strand) const {
    require_strand(strand);
    char resolved = resolve_key(key, strand);
    int slot = strand_slot(strand);

    std::lock_guard<std::mutex> lock(matcher_mutex_);
    auto& entry = matchers_[{resolved, slot}];
    if (!entry) {
        entry = std::make_unique<CodonMatcher>(concrete_set(resolved, slot));
    }
    return *entry;
}

std::string GeneticCode::residues_string() const {
    return std::string(concrete_[0].begin(), concrete_[0].end());
}

std::string GeneticCode::starts_string() const {
    std::string flags(NUM_CODONS, '-');
    for (size_t i = 0; i < NUM_CODONS; ++i) {
        if (starts_[0][i]) flags[i] = 'M';
    }
    return flags;
}

}  // namespace orfkit
