#include "dictionary.hpp"
#include <string_view>

namespace textseg {

namespace {

// Technical vocabulary, mixed lengths; bucketed by code point count on load
constexpr std::string_view kDefaultWords[] = {
    "中文", "分词", "字符", "文本", "处理", "分析", "搜索", "匹配",
    "算法", "数据", "结构", "数组", "对象", "函数", "方法", "参数",
    "返回", "结果", "循环", "条件", "判断", "过滤", "排序", "查找",
    "替换", "分割", "合并", "提取", "转换", "类型", "格式", "编码",
    "解码", "输入", "输出", "读取", "写入", "加载", "保存", "导入",
    "导出", "创建", "删除", "修改", "更新", "查询", "插入", "移除",
    "清空", "开始", "结束", "停止", "暂停", "继续", "成功", "失败",
    "错误", "警告", "提示", "信息", "日志", "调试", "用户", "系统",
    "程序", "应用", "服务", "接口", "模块", "组件", "页面", "窗口",
    "按钮", "标签", "菜单", "列表", "表格", "图表", "链接", "路径",
    "地址", "域名", "网址", "邮箱", "电话", "密码", "文件", "目录",
    "名称", "大小", "日期", "时间", "浏览", "下载", "上传", "复制",
    "粘贴", "剪切", "撤销", "选择", "全选", "反选", "展开", "折叠",
    "刷新", "同步", "异步", "本地", "远程", "在线", "离线", "网络",
    "连接", "断开", "超时", "安全", "权限", "验证", "登录", "注销",
    "注册", "绑定", "解绑", "设置", "配置", "选项", "偏好", "主题",
    "语言", "字体", "颜色", "开发", "测试", "部署", "发布", "版本",
    "升级", "降级", "前端", "后端", "全栈", "客户端", "服务器",
    "数据库", "缓存", "消息", "浏览器", "字符串", "正则", "表达式",
    "返回值", "格式化", "压缩", "解压", "加密", "解密", "重启", "取消",
    "确认", "文件夹", "重做", "中文分词", "数组操作",
    "对象属性", "函数调用", "方法参数", "循环语句", "条件判断",
    "过滤条件", "排序规则", "查找结果", "替换内容", "分割字符",
    "合并数组", "提取信息", "转换格式", "编码方式", "解码结果",
    "输入框", "输出流", "读取文件", "写入数据", "加载资源",
    "保存设置", "导入配置", "导出数据", "创建实例", "删除记录",
    "修改内容", "更新状态", "查询条件", "插入位置", "移除元素",
    "清空缓存", "开始执行", "结束任务", "停止服务", "暂停播放",
    "继续下载", "重启系统", "取消操作", "确认删除", "成功提示",
    "失败原因", "错误信息", "警告弹窗", "提示消息", "信息面板",
    "日志记录", "调试模式", "用户中心", "系统设置", "程序入口",
    "应用商店", "服务接口", "模块加载", "组件渲染", "页面跳转",
    "窗口管理", "按钮点击", "标签切换", "菜单展开", "列表滚动",
    "表格排序", "图表展示", "链接跳转", "路径导航", "地址解析",
    "域名解析", "网址访问", "邮箱验证", "电话拨打", "密码重置",
    "文件上传", "目录遍历", "名称修改", "大小计算", "日期选择",
    "时间显示", "下载管理", "上传进度", "复制粘贴", "剪切板",
    "撤销操作", "重做步骤", "选择文件", "全选内容", "反选项目",
    "展开详情", "折叠面板", "刷新页面", "同步数据", "异步请求",
    "本地存储", "远程调用", "在线状态", "离线模式", "网络请求",
    "连接超时", "断开连接", "超时重试", "安全验证", "权限控制",
    "验证身份", "登录状态", "注销账号", "注册用户", "绑定手机",
    "解绑邮箱", "设置页面", "配置选项", "偏好设置", "主题切换",
    "语言选择", "字体大小", "颜色主题", "开发环境", "测试用例",
    "部署上线", "发布版本", "版本控制", "更新日志", "升级提示",
    "降级处理", "前端框架", "后端服务", "全栈开发", "服务器端",
    "数据库表", "缓存策略", "消息队列",
};

constexpr std::string_view kDefaultStopWords[] = {
    "的", "了", "是", "在", "有", "和", "与", "或", "但", "而", "且", "这",
    "那", "之", "于", "以", "及", "等", "个", "为", "就", "都", "着", "一个",
    "没有", "我们", "你们", "他们",
};

} // namespace

Dictionary Dictionary::with_defaults() {
    Dictionary dict;
    for (std::string_view word : kDefaultWords) {
        dict.add_word(word);
    }
    for (std::string_view word : kDefaultStopWords) {
        dict.add_stop_word(word);
    }
    return dict;
}

} // namespace textseg
