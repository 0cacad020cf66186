#include "audioprint/dsp/beat_tracker.hpp"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "audioprint/dsp/stft.hpp"

namespace audioprint {
namespace dsp {

namespace {

/**
 * @brief Zero-padded FFT autocorrelation of a fixed-length block
 */
class Autocorrelator {
public:
    explicit Autocorrelator(int length)
        : length_(length)
    {
        fft_size_ = 1;
        while (fft_size_ < 2 * length_ - 1) {
            fft_size_ <<= 1;
        }

        std::lock_guard<std::mutex> lock(fftwPlannerMutex());
        time_ = fftwf_alloc_real(fft_size_);
        freq_ = fftwf_alloc_complex(fft_size_ / 2 + 1);
        if (time_ && freq_) {
            forward_ = fftwf_plan_dft_r2c_1d(fft_size_, time_, freq_, FFTW_ESTIMATE);
            inverse_ = fftwf_plan_dft_c2r_1d(fft_size_, freq_, time_, FFTW_ESTIMATE);
        }
        if (!forward_ || !inverse_) {
            release();
            throw std::runtime_error("Failed to create autocorrelation plans (size=" +
                                     std::to_string(fft_size_) + ")");
        }
    }

    ~Autocorrelator() {
        std::lock_guard<std::mutex> lock(fftwPlannerMutex());
        release();
    }

    Autocorrelator(const Autocorrelator&) = delete;
    Autocorrelator& operator=(const Autocorrelator&) = delete;

    /// @brief ac[lag] for lag in [0, length)
    void compute(const std::vector<float>& block, std::vector<double>& ac) {
        std::fill(time_, time_ + fft_size_, 0.0f);
        std::copy(block.begin(), block.end(), time_);

        fftwf_execute(forward_);
        const int bins = fft_size_ / 2 + 1;
        for (int k = 0; k < bins; ++k) {
            const float re = freq_[k][0];
            const float im = freq_[k][1];
            freq_[k][0] = re * re + im * im;
            freq_[k][1] = 0.0f;
        }
        fftwf_execute(inverse_);

        ac.resize(length_);
        for (int lag = 0; lag < length_; ++lag) {
            ac[lag] = static_cast<double>(time_[lag]) / fft_size_;
        }
    }

private:
    int length_;
    int fft_size_ = 0;
    float* time_ = nullptr;
    fftwf_complex* freq_ = nullptr;
    fftwf_plan forward_ = nullptr;
    fftwf_plan inverse_ = nullptr;

    void release() {
        if (forward_) { fftwf_destroy_plan(forward_); forward_ = nullptr; }
        if (inverse_) { fftwf_destroy_plan(inverse_); inverse_ = nullptr; }
        if (time_) { fftwf_free(time_); time_ = nullptr; }
        if (freq_) { fftwf_free(freq_); freq_ = nullptr; }
    }
};

double median(std::vector<double> values) {
    const std::size_t n = values.size();
    std::sort(values.begin(), values.end());
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

}  // namespace

BeatTracker::BeatTracker(const ExtractorConfig& config, int sample_rate)
    : config_(config)
    , sample_rate_(sample_rate)
    , frame_rate_(static_cast<double>(sample_rate) / config.hop_length)
{
}

int BeatTracker::tempogramWindow() const {
    return std::max(1, static_cast<int>(std::lround(config_.tempo_ac_size_s * frame_rate_)));
}

std::vector<int> BeatTracker::trimWeakBeats(const std::vector<int>& beats,
                                            const std::vector<double>& localscore) {
    const int nb = static_cast<int>(beats.size());
    if (nb == 0) {
        return {};
    }

    // Hann-smoothed beat score, centred part of the full convolution
    const double hann5[5] = {0.0, 0.5, 1.0, 0.5, 0.0};
    std::vector<double> full(nb + 4, 0.0);
    for (int b = 0; b < nb; ++b) {
        for (int k = 0; k < 5; ++k) {
            full[b + k] += localscore[beats[b]] * hann5[k];
        }
    }
    double sq = 0.0;
    for (int i = 2; i < nb + 2; ++i) {
        sq += full[i] * full[i];
    }
    const double threshold = 0.5 * std::sqrt(sq / nb);

    int lo = 0;
    while (lo < nb && localscore[beats[lo]] <= threshold) ++lo;
    int hi = nb - 1;
    while (hi >= lo && localscore[beats[hi]] <= threshold) --hi;
    return std::vector<int>(beats.begin() + lo, beats.begin() + hi + 1);
}

double BeatTracker::lagToBpm(int lag) const {
    if (lag <= 0) {
        return std::numeric_limits<double>::infinity();
    }
    return 60.0 * frame_rate_ / lag;
}

std::vector<double> BeatTracker::meanTempogram(const std::vector<float>& onset_envelope) const {
    const int win = tempogramWindow();
    const int n = static_cast<int>(onset_envelope.size());
    std::vector<double> mean_ac(win, 0.0);
    if (n == 0) {
        return mean_ac;
    }

    // Centre the analysis windows: linear ramps from 0 to the edge values
    const int pad = win / 2;
    std::vector<float> padded(static_cast<std::size_t>(n) + 2 * pad, 0.0f);
    const float first = onset_envelope.front();
    const float last = onset_envelope.back();
    for (int j = 0; j < pad; ++j) {
        padded[j] = first * static_cast<float>(j) / pad;
        padded[pad + n + j] = last * static_cast<float>(pad - 1 - j) / pad;
    }
    std::copy(onset_envelope.begin(), onset_envelope.end(), padded.begin() + pad);

    const std::vector<float> window = Stft::createHannWindow(win);
    Autocorrelator autocorrelator(win);
    std::vector<float> block(win);
    std::vector<double> ac;

    for (int t = 0; t < n; ++t) {
        for (int j = 0; j < win; ++j) {
            const std::size_t idx = static_cast<std::size_t>(t) + j;
            block[j] = idx < padded.size() ? padded[idx] * window[j] : 0.0f;
        }
        autocorrelator.compute(block, ac);

        // Max-norm each column; near-silent columns are left as they are
        double peak = 0.0;
        for (double v : ac) {
            peak = std::max(peak, std::fabs(v));
        }
        const double scale = peak > std::numeric_limits<float>::min() ? 1.0 / peak : 1.0;
        for (int lag = 0; lag < win; ++lag) {
            mean_ac[lag] += ac[lag] * scale;
        }
    }

    for (double& v : mean_ac) {
        v /= n;
    }
    return mean_ac;
}

double BeatTracker::estimateTempo(const std::vector<float>& onset_envelope) const {
    const std::vector<double> tempogram = meanTempogram(onset_envelope);
    const int win = static_cast<int>(tempogram.size());

    // Lags faster than max_tempo are excluded
    int min_lag = 1;
    while (min_lag < win && lagToBpm(min_lag) >= config_.max_tempo) {
        ++min_lag;
    }
    if (min_lag >= win) {
        return 0.0;
    }

    const double log2_start = std::log2(config_.start_bpm);
    int best_lag = min_lag;
    double best_score = -std::numeric_limits<double>::infinity();
    for (int lag = min_lag; lag < win; ++lag) {
        const double z = (std::log2(lagToBpm(lag)) - log2_start) / config_.std_bpm;
        const double score = std::log1p(1e6 * tempogram[lag]) - 0.5 * z * z;
        if (score > best_score) {
            best_score = score;
            best_lag = lag;
        }
    }

    return lagToBpm(best_lag);
}

std::vector<int> BeatTracker::trackBeats(const std::vector<float>& onset_envelope, double bpm) const {
    const int n = static_cast<int>(onset_envelope.size());
    if (n == 0 || !(bpm > 0.0)) {
        return {};
    }

    const int period = std::max(1, static_cast<int>(std::nearbyint(60.0 * frame_rate_ / bpm)));

    // Normalise by the sample standard deviation
    double mean = 0.0;
    for (float v : onset_envelope) mean += v;
    mean /= n;
    double var = 0.0;
    for (float v : onset_envelope) var += (v - mean) * (v - mean);
    const double stddev = n > 1 ? std::sqrt(var / (n - 1)) : 0.0;
    const double norm = stddev + std::numeric_limits<double>::min();

    // Local score: envelope smoothed by a Gaussian of width period / 32
    std::vector<double> gauss(2 * period + 1);
    for (int k = -period; k <= period; ++k) {
        const double x = k * 32.0 / period;
        gauss[k + period] = std::exp(-0.5 * x * x);
    }
    std::vector<double> localscore(n, 0.0);
    for (int i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int k = -period; k <= period; ++k) {
            const int idx = i + k;
            if (idx >= 0 && idx < n) {
                sum += onset_envelope[idx] / norm * gauss[k + period];
            }
        }
        localscore[i] = sum;
    }

    // Transition weights for predecessors 2 periods .. period/2 back
    const int far = -2 * period;
    const int near = -static_cast<int>(std::nearbyint(period / 2.0));
    std::vector<int> offsets;
    std::vector<double> txwt;
    for (int d = far; d <= near; ++d) {
        offsets.push_back(d);
        const double l = std::log(-static_cast<double>(d) / period);
        txwt.push_back(-config_.beat_tightness * l * l);
    }

    std::vector<double> cumscore(n, 0.0);
    std::vector<int> backlink(n, -1);
    const double score_thresh = 0.01 * *std::max_element(localscore.begin(), localscore.end());
    bool first_beat = true;

    for (int i = 0; i < n; ++i) {
        int best = 0;
        double best_value = -std::numeric_limits<double>::infinity();
        for (std::size_t j = 0; j < offsets.size(); ++j) {
            const int prev = i + offsets[j];
            const double candidate = txwt[j] + (prev >= 0 ? cumscore[prev] : 0.0);
            if (candidate > best_value) {
                best_value = candidate;
                best = static_cast<int>(j);
            }
        }
        cumscore[i] = localscore[i] + best_value;

        if (first_beat && localscore[i] < score_thresh) {
            backlink[i] = -1;
        } else {
            backlink[i] = i + offsets[best];
            first_beat = false;
        }
    }

    // Last beat: latest local maximum of cumscore above half the median peak
    std::vector<char> is_max(n, 0);
    std::vector<double> peak_scores;
    for (int i = 0; i < n; ++i) {
        const double prev = i > 0 ? cumscore[i - 1] : cumscore[i];
        const double next = i + 1 < n ? cumscore[i + 1] : cumscore[i];
        if (cumscore[i] > prev && cumscore[i] >= next) {
            is_max[i] = 1;
            peak_scores.push_back(cumscore[i]);
        }
    }

    int tail = -1;
    if (peak_scores.empty()) {
        tail = static_cast<int>(std::max_element(cumscore.begin(), cumscore.end()) - cumscore.begin());
    } else {
        const double med = median(peak_scores);
        for (int i = n - 1; i >= 0; --i) {
            if (is_max[i] && cumscore[i] * 2.0 > med) {
                tail = i;
                break;
            }
        }
        if (tail < 0) {
            tail = static_cast<int>(std::max_element(cumscore.begin(), cumscore.end()) - cumscore.begin());
        }
    }

    std::vector<int> beats;
    beats.push_back(tail);
    while (backlink[tail] >= 0) {
        tail = backlink[tail];
        beats.push_back(tail);
    }
    std::reverse(beats.begin(), beats.end());

    return trimWeakBeats(beats, localscore);
}

BeatResult BeatTracker::track(const std::vector<float>& onset_envelope) const {
    BeatResult result;
    const bool any = std::any_of(onset_envelope.begin(), onset_envelope.end(),
                                 [](float v) { return v != 0.0f; });
    if (!any) {
        return result;
    }

    result.tempo = estimateTempo(onset_envelope);
    result.beats = trackBeats(onset_envelope, result.tempo);
    return result;
}

}  // namespace dsp
}  // namespace audioprint
