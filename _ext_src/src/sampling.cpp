// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "sampling.h"
#include "utils.h"

namespace psn {

namespace {

// 将[B, ...]的索引展平为[B, K, C], 用于沿点维度gather/scatter
at::Tensor expand_flat_index(const at::Tensor &idx, const int64_t c) {
  return idx.reshape({idx.size(0), -1, 1}).expand({-1, -1, c});
}

/*
 * @brief gather_points的autograd封装
 *
 * 前向调用gather_points, 反向调用gather_points_grad, 与CUDA扩展中
 * 前向/反向分开实现的方式一致。
 */
class GatherPoints : public torch::autograd::Function<GatherPoints> {
 public:
  static at::Tensor forward(torch::autograd::AutogradContext *ctx,
                            at::Tensor points, at::Tensor idx) {
    ctx->save_for_backward({idx});
    ctx->saved_data["n"] = points.size(1);
    return gather_points(points, idx);
  }

  static torch::autograd::variable_list backward(
      torch::autograd::AutogradContext *ctx,
      torch::autograd::variable_list grad_output) {
    auto saved = ctx->get_saved_variables();
    const int64_t n = ctx->saved_data["n"].toInt();
    return {gather_points_grad(grad_output[0].contiguous(), saved[0], n),
            at::Tensor()};
  }
};

}  // namespace

at::Tensor gather_points(at::Tensor points, at::Tensor idx) {
  CHECK_DIM(points, 3);
  CHECK_IS_LONG(idx);
  CHECK_SAME_DEVICE(points, idx);
  TORCH_CHECK(idx.dim() >= 1 && idx.size(0) == points.size(0),
              "idx must share the batch dimension of points");

  const int64_t c = points.size(2);

  // [B, K, C], K为idx除批次维以外所有维度之积
  at::Tensor output = points.gather(1, expand_flat_index(idx, c));

  std::vector<int64_t> shape = idx.sizes().vec();
  shape.push_back(c);
  return output.reshape(shape);
}

at::Tensor gather_points_grad(at::Tensor grad_out, at::Tensor idx,
                              const int64_t n) {
  CHECK_IS_FLOATING(grad_out);
  CHECK_IS_LONG(idx);
  CHECK_SAME_DEVICE(grad_out, idx);

  const int64_t c = grad_out.size(-1);

  // 创建输出张量, 初始化为0, 形状为[B, N, C]
  at::Tensor output = torch::zeros({grad_out.size(0), n, c}, grad_out.options());

  // 同一点被多次采样时, 梯度累加
  output.scatter_add_(1, expand_flat_index(idx, c),
                      grad_out.reshape({grad_out.size(0), -1, c}));
  return output;
}

at::Tensor index_points(at::Tensor points, at::Tensor idx) {
  return GatherPoints::apply(points, idx);
}

at::Tensor select_topk(at::Tensor scores, const int64_t k) {
  CHECK_DIM(scores, 3);
  CHECK_IS_FLOATING(scores);
  TORCH_CHECK(k > 0 && k < scores.size(2),
              "The number of grouped points must less than input points ! (k=",
              k, ", m=", scores.size(2), ")");

  return std::get<1>(torch::topk(scores, k, /*dim=*/2));
}

at::Tensor sample_gumbel(at::IntArrayRef shape, const at::TensorOptions &options,
                         double eps) {
  at::Tensor u = torch::rand(shape, options);
  return -torch::log(-torch::log(u + eps) + eps);
}

at::Tensor onehot_from_logits(at::Tensor logits) {
  at::Tensor argmax = logits.argmax(-1, /*keepdim=*/true);
  return torch::zeros_like(logits).scatter_(-1, argmax, 1.0);
}

at::Tensor relaxed_select(at::Tensor scores, const double temperature,
                          const bool hard) {
  CHECK_IS_FLOATING(scores);
  TORCH_CHECK(temperature > 0, "temperature must be positive, got ",
              temperature);

  at::Tensor gumbels = sample_gumbel(scores.sizes(), scores.options());
  at::Tensor soft = torch::softmax((scores + gumbels) / temperature, -1);
  if (!hard) {
    return soft;
  }

  // 直通估计: 前向值为one-hot, 梯度沿soft回传
  at::Tensor y_hard = onehot_from_logits(soft);
  return y_hard - soft.detach() + soft;
}

}  // namespace psn
