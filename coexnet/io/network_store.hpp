#pragma once

#include "coexnet/core/type.hpp"
#include "coexnet/core/error.hpp"
#include "coexnet/core/dense.hpp"
#include "coexnet/io/hdf5.hpp"
#include "coexnet/kernel/modules.hpp"
#include "coexnet/kernel/network.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#ifdef COEXNET_HAS_HDF5

// =============================================================================
// FILE: coexnet/io/network_store.hpp
// BRIEF: HDF5 persistence of labeled matrices and analysis results
//
// Labeled matrix group:
//   values      (rows x cols, f64)
//   row_names   (vlen string)
//   col_names   (vlen string)
//
// Analysis layout, under /<analysis_id>/:
//   @power, @advised_power (when advice exists)
//   soft_threshold/{power, signed_r2, slope, truncated_r2, mean_k, median_k, max_k}
//   assignment/{gene_names, unmerged, merged, merge_history (h x 3)}
//   eigengenes/{values, row_names, col_names, module_ids, variance_explained}
//   module_trait/{cor, pvalue, module_ids, trait_names}
//   genes/{gene_names, module, kme, kme_pvalue, gs, gs_pvalue, @gs_trait}
//   hubs/<label>/{genes, hub_genes, hub_kme, hub_kme_pvalue, hub_gs, hub_gs_pvalue}
// =============================================================================

namespace coexnet::io {

namespace detail {

inline std::vector<double> to_f64(const Real* data, Size n) {
    std::vector<double> out(n);
    for (Size i = 0; i < n; ++i) out[i] = static_cast<double>(data[i]);
    return out;
}

inline std::vector<int64_t> to_i64(const std::vector<Index>& v) {
    return std::vector<int64_t>(v.begin(), v.end());
}

inline void write_matrix(h5::Location& loc, const std::string& name, const Matrix& m) {
    const auto values = to_f64(m.data(), m.size());
    loc.write_dataset(name, values.data(),
                      {static_cast<hsize_t>(m.rows()), static_cast<hsize_t>(m.cols())});
}

} // namespace detail

inline void write_labeled_matrix(h5::Location& loc, const std::string& name, const LabeledMatrix& m) {
    m.validate_names("write_labeled_matrix");
    h5::Group g = h5::Group::create(loc.id(), name);
    detail::write_matrix(g, "values", m.values);
    g.write_strings("row_names", m.row_names);
    g.write_strings("col_names", m.col_names);
}

/// @brief Read a labeled matrix group; names are validated.
inline LabeledMatrix read_labeled_matrix(const h5::Location& loc, const std::string& name) {
    if (!loc.exists(name)) {
        throw ReadError("read_labeled_matrix: no group '" + name + "'");
    }
    h5::Group g(loc.id(), name);

    h5::Dataset dset = g.open_dataset("values");
    const auto dims = dset.get_dims();
    if (dims.size() != 2) {
        throw ReadError("read_labeled_matrix: '" + name + "/values' must be 2-dimensional");
    }

    LabeledMatrix m;
    m.values = Matrix(static_cast<Index>(dims[0]), static_cast<Index>(dims[1]));
    if (m.values.size() > 0) {
        std::vector<double> buf(m.values.size());
        dset.read(buf.data());
        for (Size i = 0; i < buf.size(); ++i) {
            m.values.data()[i] = static_cast<Real>(buf[i]);
        }
    }
    m.row_names = g.open_dataset("row_names").read_strings();
    m.col_names = g.open_dataset("col_names").read_strings();
    m.validate_names(("read_labeled_matrix: '" + name + "'").c_str());
    return m;
}

inline LabeledMatrix read_labeled_matrix(const std::string& path, const std::string& name) {
    h5::File file(path, H5F_ACC_RDONLY);
    return read_labeled_matrix(file, name);
}

/// @brief Persist an analysis under /<analysis_id>.
///
/// An existing group of the same id is replaced when overwrite is set,
/// otherwise WriteError is thrown.
inline void write_analysis(h5::File& file, const kernel::network::AnalysisResult& r, bool overwrite = false) {
    namespace km = kernel::modules;

    if (r.analysis_id.empty()) {
        throw WriteError("write_analysis: analysis_id is empty");
    }
    // One hubs/<label> group per module; checked before anything is written
    std::vector<std::string> hub_labels;
    for (const auto& mh : r.hubs) {
        std::string label = km::display_label(mh.module);
        if (std::find(hub_labels.begin(), hub_labels.end(), label) != hub_labels.end()) {
            throw WriteError("write_analysis: module '" + label + "' has more than one hub list");
        }
        hub_labels.push_back(std::move(label));
    }
    if (file.exists(r.analysis_id)) {
        if (!overwrite) {
            throw WriteError("write_analysis: analysis '" + r.analysis_id + "' already exists");
        }
        file.unlink(r.analysis_id);
    }

    h5::Group root = file.create_group(r.analysis_id);
    root.write_attr<double>("power", static_cast<double>(r.power));
    if (r.advice.power) {
        root.write_attr<double>("advised_power", static_cast<double>(*r.advice.power));
    }
    if (r.advice.warning) {
        root.write_attr_string("power_warning", r.advice.warning->message);
    }

    {
        h5::Group g = root.create_group("soft_threshold");
        std::vector<double> power, r2, slope, tr2, mean_k, median_k, max_k;
        for (const auto& row : r.soft_threshold) {
            power.push_back(row.power);
            r2.push_back(row.signed_r2);
            slope.push_back(row.slope);
            tr2.push_back(row.truncated_r2);
            mean_k.push_back(row.mean_k);
            median_k.push_back(row.median_k);
            max_k.push_back(row.max_k);
        }
        g.write_dataset("power", power);
        g.write_dataset("signed_r2", r2);
        g.write_dataset("slope", slope);
        g.write_dataset("truncated_r2", tr2);
        g.write_dataset("mean_k", mean_k);
        g.write_dataset("median_k", median_k);
        g.write_dataset("max_k", max_k);
    }

    {
        h5::Group g = root.create_group("assignment");
        g.write_strings("gene_names", r.gene_names);
        g.write_dataset("unmerged", detail::to_i64(r.assignment.unmerged));
        g.write_dataset("merged", detail::to_i64(r.assignment.merged));
        std::vector<double> history;
        for (const auto& m : r.assignment.history) {
            history.push_back(static_cast<double>(m.absorbed));
            history.push_back(static_cast<double>(m.survivor));
            history.push_back(static_cast<double>(m.dissimilarity));
        }
        g.write_dataset("merge_history", history.data(),
                        {static_cast<hsize_t>(r.assignment.history.size()), 3});
    }

    {
        LabeledMatrix me;
        me.values = r.eigengenes.eigengenes;
        me.row_names = r.sample_names;
        me.col_names = kernel::membership::eigengene_names(r.eigengenes.modules);
        write_labeled_matrix(root, "eigengenes", me);
        h5::Group g = root.open_group("eigengenes");
        g.write_dataset("module_ids", detail::to_i64(r.eigengenes.modules));
        g.write_dataset("variance_explained",
                        detail::to_f64(r.eigengenes.variance_explained.data(),
                                       r.eigengenes.variance_explained.size()));
    }

    {
        h5::Group g = root.create_group("module_trait");
        detail::write_matrix(g, "cor", r.module_trait.cor);
        detail::write_matrix(g, "pvalue", r.module_trait.pvalue);
        g.write_dataset("module_ids", detail::to_i64(r.module_trait.modules));
        g.write_strings("trait_names", r.module_trait.traits);
    }

    {
        h5::Group g = root.create_group("genes");
        g.write_strings("gene_names", r.gene_names);
        g.write_dataset("module", detail::to_i64(r.assignment.merged));
        detail::write_matrix(g, "kme", r.membership.kme);
        detail::write_matrix(g, "kme_pvalue", r.membership.pvalue);
        if (r.gene_significance) {
            const auto& gs = *r.gene_significance;
            g.write_attr_string("gs_trait", gs.trait);
            g.write_dataset("gs", detail::to_f64(gs.gs.data(), gs.gs.size()));
            g.write_dataset("gs_pvalue", detail::to_f64(gs.pvalue.data(), gs.pvalue.size()));
        }
    }

    {
        h5::Group hubs = root.create_group("hubs");
        for (const auto& mh : r.hubs) {
            h5::Group g = hubs.create_group(km::display_label(mh.module));
            g.write_attr<int64_t>("module_id", static_cast<int64_t>(mh.module));
            g.write_dataset("genes", detail::to_i64(mh.genes));
            std::vector<int64_t> ids;
            std::vector<double> kme, kme_p, gs, gs_p;
            for (const auto& h : mh.hubs) {
                ids.push_back(static_cast<int64_t>(h.gene));
                kme.push_back(h.kme);
                kme_p.push_back(h.kme_pvalue);
                gs.push_back(h.gs);
                gs_p.push_back(h.gs_pvalue);
            }
            g.write_dataset("hub_genes", ids);
            g.write_dataset("hub_kme", kme);
            g.write_dataset("hub_kme_pvalue", kme_p);
            g.write_dataset("hub_gs", gs);
            g.write_dataset("hub_gs_pvalue", gs_p);
        }
    }

    file.flush();
}

inline void write_analysis(const std::string& path, const kernel::network::AnalysisResult& r,
                           bool overwrite = false) {
    h5::File file = std::filesystem::exists(path)
        ? h5::File(path, H5F_ACC_RDWR)
        : h5::File::create(path, H5F_ACC_EXCL);
    write_analysis(file, r, overwrite);
}

} // namespace coexnet::io

#endif // COEXNET_HAS_HDF5
