#pragma once

#include "types.hpp"

namespace ve {
namespace FFT {

/*
 * Unitary FFTs over the listed dimensions. With centred = true the origin is at N/2 in both domains, otherwise it is at
 * index 0 and the transform is the plain circulant DFT.
 */
template <int ND, int NFFT> void Forward(Eigen::TensorMap<CxN<ND>> data, Sz<NFFT> const fftDims, bool const centred = true);
template <int ND, int NFFT> void Forward(CxN<ND> &data, Sz<NFFT> const fftDims, bool const centred = true);
template <int ND> void           Forward(CxN<ND> &data);

template <int ND, int NFFT> void Adjoint(Eigen::TensorMap<CxN<ND>> data, Sz<NFFT> const fftDims, bool const centred = true);
template <int ND, int NFFT> void Adjoint(CxN<ND> &data, Sz<NFFT> const fftDims, bool const centred = true);
template <int ND> void           Adjoint(CxN<ND> &data);

} // namespace FFT
} // namespace ve
