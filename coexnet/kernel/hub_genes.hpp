#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/macros.hpp"
#include "coexnet/kernel/advisory.hpp"
#include "coexnet/kernel/membership.hpp"
#include "coexnet/kernel/modules.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// Hub Gene Selection
//
// For each module of interest, a gene is a hub when it belongs to the module
// (merged labels) and its kME against that module's eigengene passes
//   |kME| > kme_threshold   and   p(kME) < kme_pvalue
// =============================================================================

namespace coexnet::kernel::hub_genes {

namespace config {
    constexpr Real DEFAULT_KME_THRESHOLD = Real(0.7);
    constexpr Real DEFAULT_KME_PVALUE = Real(0.05);
}

struct HubOptions {
    Real kme_threshold = config::DEFAULT_KME_THRESHOLD;
    Real kme_pvalue = config::DEFAULT_KME_PVALUE;
};

struct HubGene {
    Index gene = 0;
    ModuleId module = UNASSIGNED_MODULE;
    Real kme = 0;
    Real kme_pvalue = 0;
    Real gs = std::numeric_limits<Real>::quiet_NaN();
    Real gs_pvalue = std::numeric_limits<Real>::quiet_NaN();
};

struct ModuleHubs {
    ModuleId module = UNASSIGNED_MODULE;
    std::vector<Index> genes;     // every gene of the module, ascending
    std::vector<HubGene> hubs;    // |kME| descending, ties by gene index
};

inline void validate(const HubOptions& options) {
    COEXNET_CHECK_RANGE(options.kme_threshold, Real(0), Real(1),
        "HubGeneSelector: kme_threshold must lie in [0, 1]");
    COEXNET_CHECK_RANGE(options.kme_pvalue, Real(0), Real(1),
        "HubGeneSelector: kme_pvalue must lie in [0, 1]");
}

/// @brief Hub subset of one module.
///
/// Throws UnknownModuleError when no gene carries `module`, or when the
/// module has genes but no kME column.
inline ModuleHubs select_hub_genes(
    const std::vector<ModuleId>& labels,
    const membership::MembershipStats& kme,
    ModuleId module,
    const HubOptions& options = {},
    const membership::GeneSignificance* gs = nullptr
) {
    validate(options);
    COEXNET_CHECK_DIM(static_cast<Index>(labels.size()) == kme.kme.rows(),
        "HubGeneSelector: " + std::to_string(labels.size()) + " labels for " +
        std::to_string(kme.kme.rows()) + " kME rows");
    if (gs) {
        COEXNET_CHECK_DIM(gs->gs.size() == labels.size(), "HubGeneSelector: GS length mismatch");
    }

    ModuleHubs out;
    out.module = module;
    if (module != UNASSIGNED_MODULE) {
        for (Size g = 0; g < labels.size(); ++g) {
            if (labels[g] == module) out.genes.push_back(static_cast<Index>(g));
        }
    }
    if (out.genes.empty()) {
        throw UnknownModuleError("HubGeneSelector: module " + std::to_string(module) + " ('" +
                                 modules::display_label(module) + "') has no genes");
    }

    const Index col = kme.column_of(module);
    if (COEXNET_UNLIKELY(col < 0)) {
        throw UnknownModuleError("HubGeneSelector: module " + std::to_string(module) +
                                 " has no eigengene in the membership table");
    }

    for (Index g : out.genes) {
        const Real r = kme.kme(g, col);
        const Real p = kme.pvalue(g, col);
        if (!(std::abs(r) > options.kme_threshold && p < options.kme_pvalue)) continue;

        HubGene hub;
        hub.gene = g;
        hub.module = module;
        hub.kme = r;
        hub.kme_pvalue = p;
        if (gs) {
            hub.gs = gs->gs[static_cast<Size>(g)];
            hub.gs_pvalue = gs->pvalue[static_cast<Size>(g)];
        }
        out.hubs.push_back(hub);
    }

    std::stable_sort(out.hubs.begin(), out.hubs.end(), [](const HubGene& a, const HubGene& b) {
        return std::abs(a.kme) > std::abs(b.kme);
    });
    return out;
}

/// @brief Hubs of several modules; an empty hub list is reported, not thrown.
inline std::vector<ModuleHubs> select_hub_genes(
    const std::vector<ModuleId>& labels,
    const membership::MembershipStats& kme,
    const std::vector<ModuleId>& modules_of_interest,
    const HubOptions& options,
    const membership::GeneSignificance* gs,
    Advisories& advisories
) {
    std::vector<ModuleHubs> out;
    out.reserve(modules_of_interest.size());
    for (ModuleId id : modules_of_interest) {
        out.push_back(select_hub_genes(labels, kme, id, options, gs));
        if (out.back().hubs.empty()) {
            report(advisories, "HubGeneSelector", "select_hub_genes",
                   "module " + modules::display_label(id) + " has no gene with |kME| > " +
                   std::to_string(options.kme_threshold) + " and p < " +
                   std::to_string(options.kme_pvalue), id);
        }
    }
    return out;
}

/// @brief 1 for hub genes of `module`, 0 elsewhere (length = n genes).
inline std::vector<std::uint8_t> hub_mask(
    const std::vector<ModuleId>& labels,
    const membership::MembershipStats& kme,
    ModuleId module,
    const HubOptions& options = {}
) {
    const ModuleHubs hubs = select_hub_genes(labels, kme, module, options);
    std::vector<std::uint8_t> mask(labels.size(), 0);
    for (const auto& h : hubs.hubs) {
        mask[static_cast<Size>(h.gene)] = 1;
    }
    return mask;
}

} // namespace coexnet::kernel::hub_genes
