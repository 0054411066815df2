// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

namespace psn {

/*
 * @brief 几何特征描述子(Geometry Features)
 *
 * 将笛卡尔坐标转换为5通道的逐点描述子 [x, y, z, θ, φ]:
 *   r = |p - origin|, θ = acos(z / r), φ = atan2(y, x)
 * 与origin重合的点(r = 0)会得到NaN角度, 此处不做处理, 由调用者保证。
 *
 * @param coordinate (Tensor) 输入点云坐标, 形状为[B, m, 3]
 * @param origin     (Tensor) 参考原点, 形状为[1, 3]
 * @return           (Tensor) 描述子, 形状为[B, m, 5]
 */
at::Tensor geometry_features(at::Tensor coordinate, at::Tensor origin);

}  // namespace psn
