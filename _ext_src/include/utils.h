// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

/*
 * @brief 检查输入张量是否为浮点类型的宏
 *
 * 用于断言x必须是浮点(float/double/half)类型的张量, 否则报错。
 * 坐标、特征、得分矩阵都需要浮点型张量。
 *
 * @param x (Tensor) 需要检查的输入张量
 */
#define CHECK_IS_FLOATING(x)                              \
  do {                                                    \
    TORCH_CHECK(at::isFloatingType(x.scalar_type()),      \
                #x " must be a floating point tensor");   \
  } while (0)

/*
 * @brief 检查输入张量是否为int64类型的宏
 *
 * topk/sort返回的索引均为int64, 分组、采样索引统一使用该类型。
 *
 * @param x (Tensor) 需要检查的输入张量
 */
#define CHECK_IS_LONG(x)                               \
  do {                                                 \
    TORCH_CHECK(x.scalar_type() == at::ScalarType::Long, \
                #x " must be a long tensor");          \
  } while (0)

/*
 * @brief 检查两个张量是否位于同一设备的宏
 *
 * @param x (Tensor) 第一个张量
 * @param y (Tensor) 第二个张量
 */
#define CHECK_SAME_DEVICE(x, y)                                  \
  do {                                                           \
    TORCH_CHECK(x.device() == y.device(),                        \
                #x " and " #y " must be on the same device");    \
  } while (0)

// 检查张量维数
#define CHECK_DIM(x, d)                                                 \
  do {                                                                  \
    TORCH_CHECK(x.dim() == d, #x " must be a ", d, "-D tensor, got ",  \
                x.dim(), "-D");                                         \
  } while (0)
