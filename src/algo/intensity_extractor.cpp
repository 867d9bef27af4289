// =============================================================================
// infinium-norm - Intensity Extractor Implementation
// =============================================================================

#include "inorm/algo/intensity_extractor.h"

#include <cstddef>

#include "inorm/common/types.h"

namespace inorm::algo {

SampleIntensities IntensityExtractor::extract(const BeadSummary& beads) const {
    SampleIntensities out;
    out.sampleId = beads.sampleId();
    extractProbes(beads, out);
    extractControls(beads, out);
    return out;
}

void IntensityExtractor::extractProbes(const BeadSummary& beads, SampleIntensities& out) const {
    const auto& probes = manifest_.probes();
    out.a.assign(probes.size(), kMissing);
    out.b.assign(probes.size(), kMissing);

    const auto threshold = static_cast<BeadCount>(minBeads_);

    for (std::size_t i = 0; i < probes.size(); ++i) {
        const Probe& probe = probes[i];

        const Channel channelA = Manifest::channelFor(probe.type, Role::kA);
        const BeadRecord& recordA = beads.at(Manifest::addressFor(probe, Role::kA), probe.id);
        if (recordA.count(channelA) >= threshold) {
            out.a[i] = recordA.mean(channelA);
        }

        const Channel channelB = Manifest::channelFor(probe.type, Role::kB);
        const BeadRecord& recordB = beads.at(Manifest::addressFor(probe, Role::kB), probe.id);
        if (recordB.count(channelB) >= threshold) {
            out.b[i] = recordB.mean(channelB);
        }
    }
}

void IntensityExtractor::extractControls(const BeadSummary& beads, SampleIntensities& out) const {
    const auto& controls = manifest_.controls();
    out.controlGrn.assign(controls.size(), kMissing);
    out.controlRed.assign(controls.size(), kMissing);

    for (std::size_t i = 0; i < controls.size(); ++i) {
        const ControlBead& control = controls[i];
        const BeadRecord& record = beads.at(control.address, control.id());
        if (record.grnCount > 0) {
            out.controlGrn[i] = record.grnMean;
        }
        if (record.redCount > 0) {
            out.controlRed[i] = record.redMean;
        }
    }
}

IntensityMatrices IntensityExtractor::extractAll(std::span<const BeadSummary> samples) const {
    std::vector<SampleIntensities> extracted;
    extracted.reserve(samples.size());
    for (const auto& beads : samples) {
        extracted.push_back(extract(beads));
    }
    return assembleIntensities(manifest_, extracted);
}

std::vector<std::string> probeIds(const Manifest& manifest) {
    std::vector<std::string> ids;
    ids.reserve(manifest.probes().size());
    for (const auto& probe : manifest.probes()) {
        ids.push_back(probe.id);
    }
    return ids;
}

std::vector<std::string> controlIds(const Manifest& manifest) {
    std::vector<std::string> ids;
    ids.reserve(manifest.controls().size());
    for (const auto& control : manifest.controls()) {
        ids.push_back(control.id());
    }
    return ids;
}

IntensityMatrices assembleIntensities(const Manifest& manifest,
                                      std::span<const SampleIntensities> samples) {
    std::vector<std::string> sampleIds;
    sampleIds.reserve(samples.size());
    for (const auto& sample : samples) {
        sampleIds.push_back(sample.sampleId);
    }

    const auto probes = probeIds(manifest);
    const auto controls = controlIds(manifest);

    IntensityMatrices out{LabeledMatrix(probes, sampleIds), LabeledMatrix(probes, sampleIds),
                          LabeledMatrix(controls, sampleIds), LabeledMatrix(controls, sampleIds)};

    for (std::size_t col = 0; col < samples.size(); ++col) {
        out.a.setColumn(col, samples[col].a);
        out.b.setColumn(col, samples[col].b);
        out.controlGrn.setColumn(col, samples[col].controlGrn);
        out.controlRed.setColumn(col, samples[col].controlRed);
    }
    return out;
}

}  // namespace inorm::algo
