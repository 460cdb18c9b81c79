//
// reproducibility.hpp - Process-wide seeding and device selection
//

#ifndef REPRODUCIBILITY_HPP
#define REPRODUCIBILITY_HPP

#include <torch/torch.h>
#include <cstdint>
#include <random>
#include <vector>

// General-purpose generator shared by the whole process. Anything that draws
// random numbers outside of torch or OpenCV should take them from here.
std::mt19937_64& global_rng();

// Seeds the general-purpose and OpenCV generators, the torch generator when
// with_torch is set, and every CUDA generator (plus deterministic cuDNN) when
// with_cuda is set. Has to run before the first shuffle or augmentation;
// values already drawn are not affected.
void fix_seeds(uint64_t seed, bool with_torch = true, bool with_cuda = true);

// cuda:<gpu_ids[0]> if any ids are given, CPU otherwise
torch::Device select_device(const std::vector<int>& gpu_ids);

#endif //REPRODUCIBILITY_HPP
