// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "geometry.h"
#include "utils.h"

namespace psn {

at::Tensor geometry_features(at::Tensor coordinate, at::Tensor origin) {
  CHECK_DIM(coordinate, 3);
  CHECK_IS_FLOATING(coordinate);
  CHECK_SAME_DEVICE(coordinate, origin);
  TORCH_CHECK(coordinate.size(2) == 3,
              "coordinate must have 3 channels, got ", coordinate.size(2));

  at::Tensor x = coordinate.select(2, 0);
  at::Tensor y = coordinate.select(2, 1);
  at::Tensor z = coordinate.select(2, 2);

  // 到原点的欧氏距离 [B, m]
  at::Tensor r = (coordinate - origin.view({1, 1, 3})).pow(2).sum(2).sqrt();
  at::Tensor th = torch::acos(z / r);
  at::Tensor fi = torch::atan2(y, x);

  return torch::cat({coordinate, th.unsqueeze(2), fi.unsqueeze(2)}, -1);
}

}  // namespace psn
