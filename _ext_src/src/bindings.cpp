// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include <torch/extension.h>

#include "ball_query.h"
#include "geometry.h"
#include "group_points.h"
#include "psn.h"
#include "sampling.h"

namespace py = pybind11;

namespace {

// 未定义张量转换为None
py::object tensor_or_none(const at::Tensor &t) {
  return t.defined() ? py::cast(t) : py::none();
}

py::object tensors_or_none(const std::vector<at::Tensor> &ts) {
  return ts.empty() ? py::none() : py::cast(ts);
}

/*
 * @brief 按变体将SamplingResult转换为Python元组
 *
 * kLearnable:  (sampled_points, grouped_points, sampled_feature, grouped_feature, Q)
 * kRadius:     (sampled_indices, grouped_indices)
 * kMultiScale: (sampled_points, [grouped_points...], sampled_feature, [grouped_feature...], Q)
 */
py::tuple result_to_tuple(const psn::SamplingResult &r, psn::Variant variant) {
  switch (variant) {
    case psn::Variant::kRadius:
      return py::make_tuple(r.sampled_indices, r.grouped_indices);
    case psn::Variant::kMultiScale:
      return py::make_tuple(r.sampled_points, py::cast(r.grouped_points_msg),
                            tensor_or_none(r.sampled_feature),
                            tensors_or_none(r.grouped_feature_msg), r.scores);
    case psn::Variant::kLearnable:
      break;
  }
  return py::make_tuple(r.sampled_points, r.grouped_points,
                        tensor_or_none(r.sampled_feature),
                        tensor_or_none(r.grouped_feature), r.scores);
}

py::tuple psn_forward(psn::PointStructuringNetImpl &self, at::Tensor coordinate,
                      c10::optional<at::Tensor> feature, bool train) {
  psn::SamplingResult r =
      self.forward(coordinate, feature.has_value() ? *feature : at::Tensor(),
                   train);
  return result_to_tuple(r, self.options.variant());
}

}  // namespace

#define PSN_BIND_OPTION(cls, type, name)                                \
  cls.def_property(                                                     \
      #name, [](const psn::PSNOptions &o) { return o.name(); },        \
      [](psn::PSNOptions &o, type v) { o.name(v); })

/*
 * @brief PyTorch扩展模块绑定
 *
 * 使用pybind11将PSN模块及其点云操作注册为Python可调用接口,
 * 供外部训练框架直接调用。
 */
PYBIND11_MODULE(TORCH_EXTENSION_NAME, m) {
  py::enum_<psn::Variant>(m, "Variant")
      .value("learnable", psn::Variant::kLearnable)
      .value("radius", psn::Variant::kRadius)
      .value("multi_scale", psn::Variant::kMultiScale);

  py::enum_<psn::Layout>(m, "Layout")
      .value("channel_last", psn::Layout::kChannelLast)
      .value("channel_first", psn::Layout::kChannelFirst);

  auto options = py::class_<psn::PSNOptions>(m, "PSNOptions")
                     .def(py::init<>())
                     .def_static("learnable", &psn::PSNOptions::learnable,
                                 py::arg("num_to_sample") = 512,
                                 py::arg("max_local_num") = 32,
                                 py::arg("mlp") = std::vector<int64_t>{32, 128},
                                 py::arg("global_feature") = false)
                     .def_static("radius_query", &psn::PSNOptions::radius_query,
                                 py::arg("num_to_sample") = 512,
                                 py::arg("radius") = 1.0,
                                 py::arg("max_local_num") = 32,
                                 py::arg("mlp") = std::vector<int64_t>{32, 64, 256},
                                 py::arg("global_feature") = false)
                     .def_static("multi_scale", &psn::PSNOptions::multi_scale,
                                 py::arg("num_to_sample") = 512,
                                 py::arg("msg_n") = std::vector<int64_t>{32, 64},
                                 py::arg("mlp") = std::vector<int64_t>{32, 64, 256},
                                 py::arg("global_feature") = false)
                     .def("validate", &psn::PSNOptions::validate);
  PSN_BIND_OPTION(options, psn::Variant, variant);
  PSN_BIND_OPTION(options, int64_t, num_to_sample);
  PSN_BIND_OPTION(options, int64_t, max_local_num);
  PSN_BIND_OPTION(options, std::vector<int64_t>, mlp);
  PSN_BIND_OPTION(options, bool, global_feature);
  PSN_BIND_OPTION(options, double, radius);
  PSN_BIND_OPTION(options, std::vector<int64_t>, msg_n);
  PSN_BIND_OPTION(options, double, temperature);
  PSN_BIND_OPTION(options, psn::Layout, layout);
  PSN_BIND_OPTION(options, int64_t, num_points);

  // @brief Point Structuring Net模块
  // forward按变体返回元组, feature可以为None。
  // force_enable关闭bind_module自动注册的forward/__call__(其返回值
  // SamplingResult无法转换为Python对象), 只保留psn_forward一个重载。
  torch::python::bind_module<psn::PointStructuringNetImpl,
                             /*force_enable=*/true>(m, "PointStructuringNet")
      .def(py::init<psn::PSNOptions>(), py::arg("options"))
      .def("forward", &psn_forward, py::arg("coordinate"),
           py::arg("feature") = py::none(), py::arg("train") = false)
      .def("__call__", &psn_forward, py::arg("coordinate"),
           py::arg("feature") = py::none(), py::arg("train") = false)
      .def("scores", &psn::PointStructuringNetImpl::scores);

  // @brief 几何特征描述子 [x, y, z, θ, φ]
  m.def("geometry_features", &psn::geometry_features);

  // @brief 点云特征采样(Gather Points)及其反向传播
  m.def("gather_points", &psn::gather_points);
  m.def("gather_points_grad", &psn::gather_points_grad);

  // @brief 可反向传播的点云索引
  m.def("index_points", &psn::index_points);

  // @brief Top-k邻域选择
  m.def("select_topk", &psn::select_topk);

  // @brief Gumbel-Softmax直通采样
  m.def("relaxed_select", &psn::relaxed_select, py::arg("scores"),
        py::arg("temperature") = 0.1, py::arg("hard") = true);

  // @brief 球查询邻域修正
  m.def("ball_query_refine", &psn::ball_query_refine);

  // @brief 多尺度邻域切片
  m.def("slice_neighborhoods", &psn::slice_neighborhoods);

  // @brief 分组覆盖率
  m.def("grouping_coverage", &psn::grouping_coverage);
}
