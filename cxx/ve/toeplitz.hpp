#pragma once

#include "op/veasl.hpp"

namespace ve {
namespace Toeplitz {

/*
 * Double a tensor along one axis as a circulant column: [first, 0, mirror[0 .. N-2]]. The sample at N is the lag that
 * can never be reached inside the unpadded extent.
 */
auto EmbedAxis(Cx3 const &first, Cx3 const &mirror, Index const axis) -> Cx3;

/*
 * Fourier-domain kernel of the normal operator, [2Nx, 2Ny, 2Nz or 1, Nt, nEnc]. For a single coil of ones,
 * U^-1(T U(pad(x))) cropped back to the matrix equals N'W N x norm^2, with U the unitary non-centred FFT.
 */
template <int ND> auto Embedding(TOps::VEASL<ND> const &op) -> Cx5;

/* As above, but fails unless op is a VEASL operator */
auto Embedding(TOps::TOp<5, 4> const &op) -> Cx5;

} // namespace Toeplitz
} // namespace ve
