/// @file src/recommendation/recommendation_mapper.cpp
/// @brief RecommendationMapper implementation.

#include "wxs/recommendation.hpp"
#include "wxs/constants.hpp"

#include <algorithm>

namespace wxs::recommend {

using catalog::IndexId;
using catalog::OutputDomain;
using catalog::Polarity;

RecommendationMapper::RecommendationMapper(const catalog::IndexCatalog& catalog,
                                           const catalog::CatalogParameters& params)
    : catalog_(catalog)
{
    for (IndexId id : catalog::ALL_INDICES) {
        scales_[static_cast<std::size_t>(id)] = catalog::band_scale(catalog_.definition(id), params);
    }
}

std::size_t RecommendationMapper::band_of(IndexId index, double value) const {
    const auto& edges = scale(index).lower_edges;
    std::size_t band = 0;
    for (std::size_t i = 1; i < edges.size(); ++i) {
        if (value + constants::BAND_EDGE_TOLERANCE >= edges[i]) {
            band = i;
        }
    }
    return band;
}

Recommendation RecommendationMapper::make(IndexId index, std::size_t ordinal) const {
    const auto& s = scale(index);
    Recommendation rec;
    rec.index    = index;
    rec.ordinal  = ordinal;
    rec.polarity = s.polarity;
    rec.label    = ordinal < s.labels.size() ? s.labels[ordinal] : std::string("unknown");
    return rec;
}

std::optional<Recommendation>
RecommendationMapper::map(const scoring::ScoreResult& result) const {
    if (!result.value) {
        return std::nullopt;
    }
    const auto& def = catalog_.definition(result.index);

    std::size_t ordinal = 0;
    if (def.domain == OutputDomain::Categorical) {
        if (!result.category) {
            return std::nullopt;
        }
        ordinal = *result.category;
    } else {
        ordinal = band_of(result.index, *result.value);
    }

    Recommendation rec = make(result.index, ordinal);
    rec.timestamp  = result.timestamp;
    rec.confidence = result.confidence;
    return rec;
}

std::optional<Recommendation>
RecommendationMapper::summarize(std::span<const scoring::ScoreResult> results,
                                IndexId index) const {
    const auto& def = catalog_.definition(index);

    std::size_t count = 0;
    double sum = 0.0;
    double worst = constants::SCORE_MIN;
    double confidence = 0.0;
    std::size_t heaviest = 0;

    for (const auto& r : results) {
        if (r.index != index || !r.value) {
            continue;
        }
        if (def.domain == OutputDomain::Categorical && !r.category) {
            continue;
        }
        ++count;
        sum += *r.value;
        worst = std::max(worst, *r.value);
        confidence += r.confidence;
        if (r.category) {
            heaviest = std::max(heaviest, *r.category);
        }
    }
    if (count == 0) {
        return std::nullopt;
    }

    std::size_t ordinal = 0;
    if (def.domain == OutputDomain::Categorical) {
        ordinal = heaviest;
    } else if (def.polarity == Polarity::Risk) {
        ordinal = band_of(index, worst);
    } else {
        ordinal = band_of(index, sum / static_cast<double>(count));
    }

    Recommendation rec = make(index, ordinal);
    rec.confidence = confidence / static_cast<double>(count);
    return rec;
}

}  // namespace wxs::recommend
