/*
 *  ibc_group_stats.cpp
 *  Part of the IBC analysis tools
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include <cmath>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "Args.h"
#include "Catalog.h"
#include "Design.h"
#include "Exceptions.h"
#include "ImageIO.h"
#include "JSON.h"
#include "LinearModel.h"
#include "Masker.h"
#include "Similarity.h"
#include "Table.h"
#include "Util.h"

namespace {

struct GroupConfig {
    std::string              catalog, mask, output, annotation, annotation_key;
    std::vector<std::string> anova_acquisitions, annotation_ignore;
    std::string              similarity_acquisition;
    double                   fdr_alpha, z_floor;
    int                      threads;
};

std::string Resolve(std::string const &path, std::string const &base) {
    if (path.empty() || path.front() == '/') {
        return path;
    }
    return base + "/" + path;
}

GroupConfig ReadConfig(std::string const &path, int const threads) {
    json const        doc  = IBC::ReadJSON(path);
    std::string const base = IBC::Dirname(path);
    GroupConfig       c;
    IBC::GetJSON(doc, "catalog", c.catalog);
    IBC::GetJSON(doc, "mask", c.mask);
    c.catalog    = Resolve(c.catalog, base);
    c.mask       = Resolve(c.mask, base);
    c.output     = IBC::GetJSONOr<std::string>(doc, "output", "output");
    c.annotation = Resolve(IBC::GetJSONOr<std::string>(doc, "annotation", ""), base);
    c.annotation_key = IBC::GetJSONOr<std::string>(doc, "annotation_key", "");
    c.annotation_ignore =
        IBC::GetJSONOr<std::vector<std::string>>(doc, "annotation_ignore", {"Tasks"});
    c.anova_acquisitions =
        IBC::GetJSONOr<std::vector<std::string>>(doc, "anova_acquisitions", {"ap", "pa"});
    c.similarity_acquisition = IBC::GetJSONOr<std::string>(doc, "similarity_acquisition", "ffx");
    c.fdr_alpha              = IBC::GetJSONOr<double>(doc, "fdr_alpha", 0.05);
    c.z_floor                = IBC::GetJSONOr<double>(doc, "z_floor", IBC::ZFloor);
    c.threads                = IBC::GetJSONOr<int>(doc, "threads", threads);
    return c;
}

std::vector<std::string> Field(IBC::Catalog const &cat, std::string IBC::CatalogEntry::*field) {
    std::vector<std::string> values;
    for (auto const &e : cat) {
        values.push_back(e.*field);
    }
    return values;
}

std::vector<std::string> ImageLabels(IBC::Catalog const &cat) {
    std::vector<std::string> labels;
    for (auto const &e : cat) {
        labels.push_back(e.subject + ":" + e.contrast);
    }
    return labels;
}

json TestToJSON(IBC::CorrelationTest const &t) {
    return json{{"r", t.r}, {"p", t.p}, {"n", t.n}};
}

/*
 * Three-way ANOVA of subject, contrast and acquisition direction
 */
json Anova(GroupConfig const &c, IBC::Catalog const &catalog, IBC::Masker const &masker) {
    auto const images = IBC::FilterAcquisitions(catalog, c.anova_acquisitions);
    IBC::Info(verbose, "ANOVA over {} images", images.size());
    IBC::FactorDesign const design({{"subject", Field(images, &IBC::CatalogEntry::subject)},
                                    {"contrast", Field(images, &IBC::CatalogEntry::contrast)},
                                    {"acquisition",
                                     Field(images, &IBC::CatalogEntry::acquisition)}});
    IBC::Log(verbose,
             "Design has {} columns, singular values {:.3g} to {:.3g}",
             design.labels().size(),
             design.smallestSingularValue(),
             design.largestSingularValue());
    if (design.degenerate()) {
        IBC::Warn("Design matrix is singular, smallest singular value {:.3g}",
                  design.smallestSingularValue());
    }
    IBC::WriteTable(c.output + "/design_matrix.tsv", design.matrix(), {}, design.labels());

    Eigen::MatrixXd const  Y = masker.Transform(IBC::Paths(images), c.threads, verbose);
    IBC::Info(verbose, "Fitting linear model");
    IBC::LinearModel const model(design.matrix(), Y);
    IBC::Log(verbose, "Model rank {} residual dof {}", model.rank(), model.dof());

    json summary{{"images", images.size()},
                 {"rank", model.rank()},
                 {"residual_dof", model.dof()},
                 {"smallest_singular_value", design.smallestSingularValue()},
                 {"degenerate", design.degenerate()}};
    std::vector<std::string> const outputs{"subject_effect", "contrast_effect", "acq_effect"};
    for (size_t f = 0; f < design.factors(); f++) {
        Eigen::ArrayXd const z = IBC::FloorZ(model.ZScore(design.contrast(f)), c.z_floor);
        double const threshold = IBC::FDRThreshold(z, c.fdr_alpha);
        IBC::Log(verbose,
                 "{} effect: {} dof, max z {:.3g}, FDR {} threshold {:.3g}",
                 design.name(f),
                 design.dof(f),
                 z.maxCoeff(),
                 c.fdr_alpha,
                 threshold);
        IBC::WriteImage(
            masker.InverseTransform(z), c.output + "/" + outputs[f] + IBC::OutExt(), verbose);
        summary[outputs[f]] = {{"dof", design.dof(f)},
                               {"levels", design.levels(f)},
                               {"fdr_threshold", std::isfinite(threshold) ? json(threshold) : json()}};
    }
    return summary;
}

/*
 * Similarity between images, then between conditions and against the cognitive annotation
 */
json GlobalSimilarity(GroupConfig const &                   c,
                      IBC::Catalog const &                  catalog,
                      IBC::Masker const &                   masker,
                      std::optional<IBC::Annotation> const &annotation) {
    auto const images = IBC::FilterAcquisitions(catalog, {c.similarity_acquisition});
    IBC::Info(verbose, "Similarity over {} images", images.size());
    Eigen::MatrixXd const X      = masker.Transform(IBC::Paths(images), c.threads, verbose);
    auto const            labels = ImageLabels(images);
    IBC::WriteTable(c.output + "/image_correlation.tsv", IBC::Correlation(X), labels, labels);
    IBC::WriteTable(c.output + "/subject_membership.tsv",
                    IBC::Membership(Field(images, &IBC::CatalogEntry::subject)),
                    labels,
                    labels);
    IBC::WriteTable(c.output + "/contrast_membership.tsv",
                    IBC::Membership(Field(images, &IBC::CatalogEntry::contrast)),
                    labels,
                    labels);
    IBC::WriteTable(c.output + "/embedding.tsv", IBC::Embedding(X, 2), labels, {"x", "y"});

    auto const sel = IBC::SelectConditions(images);
    IBC::Info(verbose,
              "Comparing {} conditions across {} subjects",
              sel.conditions.size(),
              sel.subjects.size());
    std::vector<Eigen::MatrixXd> per_subject;
    for (auto const &paths : sel.paths) {
        per_subject.push_back(masker.Transform(paths, c.threads, verbose));
    }
    auto const sim = IBC::CompareConditions(per_subject);
    IBC::WriteTable(c.output + "/condition_similarity_within.tsv",
                    sim.within,
                    sel.conditions,
                    sel.conditions);
    if (sim.across.size()) {
        IBC::WriteTable(c.output + "/condition_similarity_across.tsv",
                        sim.across,
                        sel.conditions,
                        sel.conditions);
    } else {
        IBC::Warn("Only one subject, skipping across-subject condition similarity");
    }

    json summary{{"images", images.size()}, {"subjects", sel.subjects}};
    json conditions = json::array();
    for (size_t i = 0; i < sel.conditions.size(); i++) {
        conditions.push_back({{"condition", sel.conditions[i]}, {"task", sel.tasks[i]}});
    }
    summary["conditions"] = conditions;

    if (!annotation) {
        IBC::Log(verbose, "No annotation table, skipping cognitive model");
        return summary;
    }
    std::vector<std::string> features;
    Eigen::MatrixXd const    cog = IBC::CognitiveModel(
        annotation->table, annotation->key, c.annotation_ignore, sel.conditions, features);
    for (size_t i = 0; i < sel.conditions.size(); i++) {
        std::vector<std::string> active;
        for (size_t f = 0; f < features.size(); f++) {
            if (cog(i, f) != 0.0) {
                active.push_back(features[f]);
            }
        }
        IBC::Log(verbose, "{}: {}", sel.conditions[i], fmt::join(active, ", "));
    }
    Eigen::MatrixXd const cog_corr = IBC::Correlation(cog);
    IBC::WriteTable(c.output + "/condition_similarity_cognitive.tsv",
                    cog_corr,
                    sel.conditions,
                    sel.conditions);

    auto const pairs    = IBC::UpperTrianglePairs(sim.within, cog_corr);
    auto const pearson  = IBC::Pearson(pairs.first, pairs.second);
    auto const spearman = IBC::Spearman(pairs.first, pairs.second);
    fmt::print("pearson r={:.4f} p={:.4g} n={}\n", pearson.r, pearson.p, pearson.n);
    fmt::print("spearman r={:.4f} p={:.4g} n={}\n", spearman.r, spearman.p, spearman.n);
    json const tests{{"pearson", TestToJSON(pearson)}, {"spearman", TestToJSON(spearman)}};
    IBC::WriteJSON(c.output + "/cognitive_correlation.json", tests);
    summary["cognitive_correlation"] = tests;
    return summary;
}

} // namespace

int group_stats_main(args::Subparser &parser) {
    args::Positional<std::string> config_path(parser, "CONFIG", "JSON configuration file");
    args::ValueFlag<int>          threads(parser,
                                 "THREADS",
                                 "Use N threads (default=hardware limit or $IBC_THREADS)",
                                 {'T', "threads"},
                                 IBC::GetDefaultThreads());
    args::Flag skip_anova(parser, "NO ANOVA", "Skip the ANOVA effect maps", {"no-anova"});
    args::Flag skip_similarity(
        parser, "NO SIMILARITY", "Skip the similarity analysis", {"no-similarity"});
    parser.Parse();

    auto const config = ReadConfig(IBC::CheckPos(config_path), threads.Get());
    IBC::Log(verbose, "Reading catalog {}", config.catalog);
    auto const catalog = IBC::ReadCatalog(config.catalog);
    IBC::CheckFiles(catalog);
    IBC::Log(verbose, "Catalog lists {} images", catalog.size());
    std::optional<IBC::Annotation> annotation;
    if (!skip_similarity && !config.annotation.empty()) {
        IBC::Log(verbose, "Reading annotation {}", config.annotation);
        annotation = IBC::ReadAnnotation(config.annotation, config.annotation_key);
    }

    IBC::Log(verbose, "Reading mask {}", config.mask);
    IBC::Masker const masker(IBC::ReadImage<IBC::VolumeF>(config.mask, verbose));
    IBC::Log(verbose, "Mask contains {} voxels", masker.size());
    std::filesystem::create_directories(config.output);

    json summary{{"version", IBC::GetVersion()}, {"voxels", masker.size()}};
    if (!skip_anova) {
        summary["anova"] = Anova(config, catalog, masker);
    }
    if (!skip_similarity) {
        summary["similarity"] = GlobalSimilarity(config, catalog, masker, annotation);
    }
    IBC::WriteJSON(config.output + "/group_stats.json", summary);
    IBC::Info(verbose, "Finished");
    return EXIT_SUCCESS;
}
