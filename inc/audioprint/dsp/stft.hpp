/**
 * @file stft.hpp
 * @brief Short-time Fourier transform on top of FFTW (single precision)
 *
 * Frames are centred: the signal is zero padded by n_fft/2 on both sides so
 * frame t covers samples [t*hop - n_fft/2, t*hop + n_fft/2). A signal of
 * length L yields 1 + L/hop frames.
 */

#ifndef AUDIOPRINT_DSP_STFT_HPP
#define AUDIOPRINT_DSP_STFT_HPP

#include <fftw3.h>

#include <complex>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace audioprint {
namespace dsp {

/// @brief Process-wide lock for FFTW plan creation / destruction
std::mutex& fftwPlannerMutex();

/**
 * @brief Complex spectrogram stored frame-major: data[frame * num_bins + bin]
 */
struct ComplexSpectrogram {
    int num_frames = 0;
    int num_bins = 0;
    std::vector<std::complex<float>> data;

    std::complex<float>* frame(int index) { return data.data() + static_cast<std::size_t>(index) * num_bins; }
    const std::complex<float>* frame(int index) const {
        return data.data() + static_cast<std::size_t>(index) * num_bins;
    }
};

/**
 * @class Stft
 * @brief Owns one forward and one inverse FFTW plan of a fixed size
 *
 * Plan creation and destruction are serialised process-wide; executing the
 * plans is safe from several Stft instances on different threads.
 */
class Stft {
public:
    struct Config {
        int n_fft = 2048;           ///< FFT size == window length
        int hop_length = 512;       ///< Frame advance in samples
    };

    using FrameCallback = std::function<void(int frame_index, const std::complex<float>* spectrum)>;

    /// @throws std::runtime_error if FFTW cannot allocate buffers or plans
    explicit Stft(const Config& config);
    ~Stft();

    // Non-copyable
    Stft(const Stft&) = delete;
    Stft& operator=(const Stft&) = delete;

    int getFftSize() const { return config_.n_fft; }
    int getHopLength() const { return config_.hop_length; }
    int getNumBins() const { return config_.n_fft / 2 + 1; }

    /// @brief Number of centred frames for a signal of @p length samples
    int numFrames(std::size_t length) const;

    /**
     * @brief Stream the spectrum of every frame to @p callback
     *
     * The spectrum pointer is only valid for the duration of the call and
     * holds getNumBins() values.
     */
    void forEachFrame(const std::vector<float>& signal, const FrameCallback& callback);

    /// @brief Full complex spectrogram
    ComplexSpectrogram forward(const std::vector<float>& signal);

    /// @brief Weighted overlap-add inverse, trimmed to @p length samples
    std::vector<float> inverse(const ComplexSpectrogram& spectrogram, std::size_t length);

    /// @brief Centre frequency (Hz) of every FFT bin
    static std::vector<float> binFrequencies(int n_fft, int sample_rate);

    /// @brief Periodic Hann window
    static std::vector<float> createHannWindow(int size);

private:
    Config config_;
    std::vector<float> window_;

    // FFTW resources
    fftwf_plan forward_plan_ = nullptr;
    fftwf_plan inverse_plan_ = nullptr;
    float* time_buffer_ = nullptr;
    fftwf_complex* freq_buffer_ = nullptr;

    void initializeFFTW();
    void cleanupFFTW();
    void loadFrame(const std::vector<float>& signal, int frame_index);
};

}  // namespace dsp
}  // namespace audioprint

#endif  // AUDIOPRINT_DSP_STFT_HPP
